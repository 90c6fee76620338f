// ==============================================================================
// main.cpp - MOD-0001: Точка входа приложения
// ==============================================================================
//
// MOD-0001 app
// GUIDE-0001 G-024: перехват исключений на границе app
//
// Использование: luarestore <config.yaml> [start_file]
//
// Точка входа:
// 1. Загрузка конфигурации (MOD-0008 config)
// 2. Создание Writer (MOD-0003 output) с журналом и файлом плана
// 3. Обход зависимостей (MOD-0011 discovery), Ctrl+C отменяет обход
// 4. Линеаризация (MOD-0010) и план восстановления (MOD-0012 report)
// 5. Возврат exit code: 0 - успех, 1 - ошибка конфигурации или корня,
//    2 - неверный вызов, 130 - отменено
//
// ==============================================================================

#include "luarestore/config.hpp"
#include "luarestore/discovery.hpp"
#include "luarestore/file_source.hpp"
#include "luarestore/linearizer.hpp"
#include "luarestore/output.hpp"
#include "luarestore/platform.hpp"
#include "luarestore/report.hpp"
#include "luarestore/resolver.hpp"

#include <rapidjson/document.h>

#include <csignal>
#include <exception>
#include <iostream>
#include <string>

namespace {

constexpr int EXIT_USAGE = 2;
constexpr int EXIT_CANCELLED = 130;

constexpr const char* USAGE = "usage: luarestore <config.yaml> [start_file]\n";

luarestore::discovery::CancellationToken g_cancel;

extern "C" void on_interrupt(int) {
    g_cancel.cancel();
}

int run(int argc, char** argv) {
    using namespace luarestore;

    if (argc < 2 || argc > 3) {
        std::cerr << USAGE;
        return EXIT_USAGE;
    }

    // 1. Конфигурация
    config::ConfigResult loaded = config::load_config(platform::path_from_utf8(argv[1]));
    if (!loaded.ok) {
        std::cerr << output::format_message(output::Level::Error, loaded.error.format());
        return 1;
    }
    config::Config& cfg = loaded.config;
    if (argc == 3) {
        cfg.start_file = platform::path_from_utf8(argv[2]);
    }

    // 2. Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = cfg.quiet;
    out_cfg.verbose = cfg.verbose;
    out_cfg.output_path = cfg.plan_output;
    out_cfg.log_path = cfg.log_file;
    output::Writer writer(out_cfg);

    if (cfg.log_file.has_value() && !writer.has_log_file()) {
        writer.warn("cannot open log file " + platform::path_to_utf8(*cfg.log_file));
    }
    if (cfg.plan_output.has_value() && !writer.has_output_file()) {
        writer.error("cannot open plan output " + platform::path_to_utf8(*cfg.plan_output));
        return 1;
    }
    if (!cfg.start_file.has_value()) {
        writer.error("no start file: set start_file in the config or pass it as an argument");
        return EXIT_USAGE;
    }

    writer.info("luarestore on " + platform::os_name());
    for (const auto& root : cfg.search_roots) {
        writer.debug("search root " + platform::path_to_utf8(root));
    }

    // 3. Обход
    io::DiskFileSource files(cfg.read_timeout);
    resolve::PathResolver resolver(files, cfg.search_roots, cfg.extensions);

    discovery::DiscoveryOptions options;
    options.workers = cfg.workers;
    options.max_depth = cfg.max_depth;
    discovery::DiscoveryDriver driver(files, resolver, options, &writer);

    std::signal(SIGINT, on_interrupt);
    writer.info("discovering dependencies of " + platform::path_to_utf8(*cfg.start_file));
    discovery::DiscoveryResult found = driver.run(*cfg.start_file, &g_cancel);
    std::signal(SIGINT, SIG_DFL);

    if (found.cancelled) {
        writer.warn("discovery cancelled, partial graph discarded");
        return EXIT_CANCELLED;
    }
    if (!found.ok) {
        writer.error(found.error.format());
        return 1;
    }

    // 4. Линеаризация и план
    const graph::GraphSnapshot snapshot = found.graph.snapshot();
    const graph::Linearization order = graph::linearize(snapshot);
    const report::RestorationPlan plan = report::build_plan(snapshot, order, &resolver);

    rapidjson::Document doc;
    report::plan_to_json(plan, doc);
    writer.write_json_pretty(doc);

    report::print_summary(writer, plan);
    if (cfg.plan_output.has_value()) {
        writer.info("restoration plan written to " + platform::path_to_utf8(*cfg.plan_output));
    }
    writer.flush();
    return 0;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // GUIDE-0001 G-024: формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
