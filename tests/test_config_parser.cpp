#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "../src/config_parser.hpp"

namespace fs = std::filesystem;

static fs::path write_config(const fs::path& dir, const std::string& name, const std::string& body) {
    const fs::path p = dir / name;
    std::ofstream f(p);
    f << body;
    return p;
}

int main() {
    const fs::path dir = fs::temp_directory_path() / "percentile_config_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    cfg::main_config_t c;
    auto full = write_config(dir, "full.toml",
                             "[main]\n"
                             "input = \"data\"\n"
                             "output = \"out\"\n"
                             "filename_mask = [\"lat\", \"rtt\"]\n"
                             "column = \"ms\"\n"
                             "separator = \",\"\n"
                             "[engine]\n"
                             "strategy = \"quickselect\"\n"
                             "quantiles = [0.5, 0.9, 1]\n"
                             "[benchmark]\n"
                             "sizes = [10, 20]\n"
                             "seed = 7\n"
                             "repeats = 2\n");
    if (auto err = cfg::parse_config(full, c); err) return 1;
    if (c.input_dir != fs::path("data") || c.output_dir != fs::path("out")) return 2;
    if (c.filename_mask != std::vector<std::string>{"lat", "rtt"}) return 3;
    if (c.column != "ms" || c.separator != ',') return 4;
    if (c.strategy != percentile::strategy_t::quickselect) return 5;
    if (c.quantiles != std::vector<double>{0.5, 0.9, 1.0}) return 6;
    if (c.benchmark.sizes != std::vector<std::size_t>{10, 20} || c.benchmark.seed != 7 || c.benchmark.repeats != 2) return 7;

    // defaults
    cfg::main_config_t d;
    auto minimal = write_config(dir, "minimal.toml", "[main]\ninput = \"in\"\n");
    if (auto err = cfg::parse_config(minimal, d); err) return 8;
    if (!d.output_dir.empty() || d.column != "value" || d.separator != ';') return 9;
    if (d.strategy != percentile::strategy_t::partial) return 10;
    if (d.quantiles != percentile::default_quantiles()) return 11;

    // errors
    cfg::main_config_t e;
    if (!cfg::parse_config(dir / "absent.toml", e)) return 12;
    if (!cfg::parse_config(write_config(dir, "no_main.toml", "[engine]\nstrategy = \"sort\"\n"), e)) return 13;
    if (!cfg::parse_config(write_config(dir, "no_input.toml", "[main]\noutput = \"x\"\n"), e)) return 14;
    auto bad_strategy = cfg::parse_config(
        write_config(dir, "bad_strategy.toml", "[main]\ninput = \"in\"\n[engine]\nstrategy = \"heap\"\n"), e);
    if (!bad_strategy || bad_strategy->find("heap") == std::string::npos) return 15;
    if (!cfg::parse_config(write_config(dir, "bad_q.toml", "[main]\ninput = \"in\"\n[engine]\nquantiles = [1.5]\n"), e)) return 16;
    if (!cfg::parse_config(write_config(dir, "bad_toml.toml", "[main\ninput = \n"), e)) return 17;
    if (!cfg::parse_config(write_config(dir, "bad_sep.toml", "[main]\ninput = \"in\"\nseparator = \";;\"\n"), e)) return 18;

    fs::remove_all(dir);
    return 0;
}
