/**
 * \file main.cpp
 * \brief Точка входа percentile_calculator
 *
 * Задачи:
 *  - парсинг аргументов командной строки (Boost.Program_options)
 *  - поиск и чтение конфигурации (toml++)
 *  - получение выборки: из --values или из CSV файлов (csv_reader.hpp)
 *  - расчёт квантилей выбранной стратегией (percentile_calculator.hpp)
 *  - сводка по выборке (Boost.Accumulators) и запись результата в CSV
 *  - режим --benchmark: сравнение стратегий по времени (benchmark.hpp)
 */

#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <filesystem>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <map>
#include <variant>

#include <boost/program_options.hpp>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include "benchmark.hpp"
#include "config_parser.hpp"
#include "csv_reader.hpp"
#include "percentile_calculator.hpp"
#include "sample_parser.hpp"

#if defined(_WIN32)
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;
namespace po = boost::program_options;
namespace acc = boost::accumulators;

/**
 * \brief Возвращает директорию, где находится исполняемый файл.
 * \return путь к директории exe или пустой путь при ошибке.
 */
static fs::path get_executable_dir() {
    std::string exe_path;
#if defined(_WIN32)
    wchar_t buf[MAX_PATH];
    DWORD len = GetModuleFileNameW(NULL, buf, MAX_PATH);
    if (len == 0) return {};
    std::wstring w(buf, buf + len);
    exe_path.assign(w.begin(), w.end());
#elif defined(__linux__)
    std::vector<char> buf(4096);
    ssize_t r = readlink("/proc/self/exe", buf.data(), (ssize_t)buf.size());
    if (r <= 0) return {};
    exe_path.assign(buf.data(), buf.data() + r);
#else
    // fallback: текущая рабочая директория
    return fs::current_path();
#endif
    return fs::path(exe_path).parent_path();
}

/**
 * \brief Ищет config.toml: cwd, <exe>, <exe>/examples, затем cwd/examples.
 */
static fs::path find_default_config() {
    fs::path p1 = fs::current_path() / "config.toml";
    if (fs::exists(p1)) return p1;

    auto exe_dir = get_executable_dir();
    if (!exe_dir.empty()) {
        fs::path p2 = exe_dir / "config.toml";
        if (fs::exists(p2)) return p2;
        // CMake копирует examples рядом с exe
        fs::path p3 = exe_dir / "examples" / "config.toml";
        if (fs::exists(p3)) return p3;
    }
    return fs::current_path() / "examples" / "config.toml";
}

/**
 * \brief Разбирает список долей вида "0.25,0.5,0.75".
 */
static std::vector<double> parse_quantile_list(const std::string& text) {
    std::vector<double> out;
    for (const auto& token : csv::split_line(text, ',')) {
        auto sample = percentile::parse_sample(token);
        double q = 0.0;
        if (auto i = std::get_if<std::int64_t>(&sample)) {
            q = static_cast<double>(*i);
        } else if (auto d = std::get_if<double>(&sample)) {
            q = *d;
        } else {
            throw std::invalid_argument("Invalid quantile '" + token + "'");
        }
        percentile::check_fraction(q);
        out.push_back(q);
    }
    if (out.empty()) {
        throw std::invalid_argument("Empty quantile list");
    }
    return out;
}

static std::string format_value(double v) {
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss << std::setprecision(8) << v;
    return ss.str();
}

/**
 * \brief Логирует сводку по очищенной выборке (Boost.Accumulators).
 */
static void log_summary(const std::vector<double>& clean) {
    acc::accumulator_set<double, acc::stats<acc::tag::count, acc::tag::min, acc::tag::max, acc::tag::mean>> summary;
    for (double v : clean) {
        summary(v);
    }
    spdlog::info("Выборка: n={} min={} max={} mean={}", acc::count(summary), acc::min(summary),
                 acc::max(summary), acc::mean(summary));
}

int main(int argc, char** argv)
{
#if defined(_WIN32)
    // Переключаем кодовую страницу консоли на UTF-8
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);
#endif

    try {
        // ---- Парсинг аргументов командной строки ----
        po::options_description desc("Allowed options");
        desc.add_options()
            ("help,h", "показать подсказку")
            ("config,c", po::value<std::string>(), "путь к config TOML")
            ("values", po::value<std::string>(), "выборка списком, например \"[1, 2, null, 3.5]\" (вместо CSV)")
            ("strategy,s", po::value<std::string>(), "стратегия выбора: sort | partial | quickselect")
            ("quantiles,q", po::value<std::string>(), "доли через запятую, например 0.25,0.5,0.75")
            ("benchmark,b", "сравнить стратегии по времени")
            ("verbose,v", "подробный лог (debug)")
            ;

        po::variables_map vm;
        try {
            po::store(po::parse_command_line(argc, argv, desc), vm);
            po::notify(vm);
        }
        catch (const po::error& ex) {
            spdlog::error("Ошибка аргументов: {}", ex.what());
            std::cerr << desc << "\n";
            return 1;
        }

        if (vm.count("help")) {
            std::cout << desc << "\n";
            return 0;
        }
        if (vm.count("verbose")) {
            spdlog::set_level(spdlog::level::debug);
        }

        // ---- Конфигурация ----
        // Для --values конфиг необязателен; для CSV и benchmark он читается, если найден.
        cfg::main_config_t config;
        const bool inline_values = vm.count("values") > 0;
        fs::path config_path = vm.count("config") ? fs::path(vm["config"].as<std::string>()) : find_default_config();
        const bool need_config = !inline_values && !vm.count("benchmark");

        if (need_config || fs::exists(config_path)) {
            spdlog::info("Использую конфиг: {}", config_path.string());
            auto cfg_err = cfg::parse_config(config_path, config);
            if (cfg_err) {
                spdlog::error("Ошибка парсинга конфига: {}", *cfg_err);
                return 2;
            }
        }

        // аргументы командной строки важнее конфига
        try {
            if (vm.count("strategy")) {
                config.strategy = percentile::parse_strategy(vm["strategy"].as<std::string>());
            }
            if (vm.count("quantiles")) {
                config.quantiles = parse_quantile_list(vm["quantiles"].as<std::string>());
            }
        }
        catch (const std::invalid_argument& ex) {
            spdlog::error("Ошибка аргументов: {}", ex.what());
            return 1;
        }

        // ---- Режим сравнения стратегий ----
        if (vm.count("benchmark")) {
            bench::options_t opts;
            opts.sizes = config.benchmark.sizes;
            opts.seed = config.benchmark.seed;
            opts.repeats = config.benchmark.repeats;
            spdlog::info("Benchmark: размеры {}, seed {}, повторов {}", fmt::join(opts.sizes, ","), opts.seed,
                         opts.repeats);
            const auto rows = bench::run(opts);
            const auto mismatches = std::count_if(rows.begin(), rows.end(),
                                                  [](const bench::row_t& r) { return !r.matches_reference; });
            if (mismatches > 0) {
                spdlog::error("Расхождений с эталоном: {}", mismatches);
                return 6;
            }
            spdlog::info("Все стратегии совпали с эталоном.");
            return 0;
        }

        // ---- Получение выборки ----
        std::vector<percentile::sample_t> samples;
        if (inline_values) {
            try {
                samples = percentile::parse_sample_list(vm["values"].as<std::string>());
            }
            catch (const percentile::input_shape_error& ex) {
                spdlog::error("Некорректная выборка: {}", ex.what());
                return 6;
            }
        }
        else {
            spdlog::info("Входная директория: {}", config.input_dir.string());
            spdlog::info("Колонка: {}", config.column);
            spdlog::info("Фильтр по именам файлов: {}", config.filename_mask.empty() ? "<все>" : fmt::format("{}", fmt::join(config.filename_mask, ",")));

            auto read_err = csv::read_csv_files(config.input_dir, config.filename_mask, config.column,
                                                config.separator, samples);
            if (read_err) {
                spdlog::error("Ошибка чтения CSV: {}", *read_err);
                return 3;
            }
        }
        spdlog::info("Прочитано значений: {}", samples.size());

        // ---- Расчёт ----
        const percentile::calculator calc(config.strategy);
        std::map<double, double> result;
        try {
            const auto clean = percentile::sanitize(samples);
            if (clean.size() < samples.size()) {
                spdlog::warn("Отброшено пустых/NaN значений: {}", samples.size() - clean.size());
            }
            if (!clean.empty()) {
                log_summary(clean);
            }
            result = calc.calculate(clean, config.quantiles);
        }
        catch (const percentile::error& ex) {
            spdlog::error("Ошибка расчёта: {}", ex.what());
            return 6;
        }

        spdlog::info("Стратегия: {}", percentile::strategy_name(calc.strategy()));
        for (const auto& [q, value] : result) {
            spdlog::info("p{}: {}", q * 100.0, format_value(value));
        }

        if (inline_values) {
            for (const auto& [q, value] : result) {
                std::cout << q << ";" << format_value(value) << "\n";
            }
            return 0;
        }

        // ---- Запись результата ----
        // Если output не задан — по умолчанию ./output (cwd)
        if (config.output_dir.empty()) {
            config.output_dir = fs::current_path() / "output";
        }
        try {
            fs::create_directories(config.output_dir);
        }
        catch (const std::exception& ex) {
            spdlog::error("Не удалось создать директорию вывода {}: {}", config.output_dir.string(), ex.what());
            return 4;
        }

        auto out_path = config.output_dir / "percentile_result.csv";
        std::ofstream ofs(out_path, std::ios::out | std::ios::trunc);
        if (!ofs.is_open()) {
            spdlog::error("Не удалось открыть файл для записи: {}", out_path.string());
            return 5;
        }
        ofs << "quantile" << config.separator << "value\n";
        for (const auto& [q, value] : result) {
            ofs << q << config.separator << format_value(value) << "\n";
        }
        ofs.close();
        spdlog::info("Результат записан в {}", out_path.string());
        spdlog::info("Готово.");
        return 0;
    }
    catch (const std::exception& ex) {
        spdlog::critical("Необработанное исключение: {}", ex.what());
        return 10;
    }
}
