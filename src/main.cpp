#include "core/http_client.h"
#include "core/prober.h"
#include "core/classifier.h"
#include "core/probe_runner.h"
#include "catalog/catalog.h"
#include "config/settings.h"
#include "logging/chain.h"
#include "report/report_writer.h"
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>

static std::atomic<ProbeRunner*> g_runner{nullptr};

/// SIGINT: ask the running probe to stop; the partial report is still written.
extern "C" void handle_sigint(int) {
    ProbeRunner* runner = g_runner.load();
    if (runner) {
        runner->cancel();
    }
}

/**
 * @brief Parse a positive integer command-line value
 * @throws std::invalid_argument if the value is not a positive integer
 */
static long parse_positive(const std::string& flag, const std::string& value) {
    size_t pos = 0;
    long v = 0;
    try {
        v = std::stol(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got: " + value);
    }
    if (pos != value.size() || v < 1) {
        throw std::invalid_argument(flag + " expects a positive number, got: " + value);
    }
    return v;
}

/**
 * @brief Load the catalog named in the settings, or the built-in one
 * @param path Catalog file, empty for the built-in catalog
 * @return Catalog to probe
 */
static catalog::Catalog load_catalog(const std::string& path) {
    if (path.empty()) {
        return catalog::Catalog::builtin();
    }
    std::cout << "Loading catalog: " << path << "\n";
    return catalog::Catalog::load(path);
}

/**
 * @brief Probes every catalog target and writes the report
 * @param argc Argument count from command line
 * @param argv Argument values from command line
 * @return 0 on success (a report was produced), 2 on usage or configuration errors
 */
int cmd_probe(int argc, char** argv) {
    std::string config_path = config::Settings::kDefaultPath;
    std::string catalog_path;
    std::string out_path;
    long concurrency = 0;
    long timeout = 0;
    bool config_given = false;

    try {
        for (int i = 2; i < argc; i++) {
            std::string a = argv[i];
            if (a == "--config" && i + 1 < argc) {
                config_path = argv[++i];
                config_given = true;
            } else if (a == "--catalog" && i + 1 < argc) {
                catalog_path = argv[++i];
            } else if (a == "--out" && i + 1 < argc) {
                out_path = argv[++i];
            } else if (a == "--concurrency" && i + 1 < argc) {
                concurrency = parse_positive(a, argv[++i]);
            } else if (a == "--timeout" && i + 1 < argc) {
                timeout = parse_positive(a, argv[++i]);
            } else {
                std::cerr << "Error: unknown argument: " << a << "\n";
                return 2;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    config::Settings settings;
    catalog::Catalog targets;
    try {
        if (config_given) {
            std::cout << "Loading config: " << config_path << "\n";
        }
        settings = config::Settings::load(config_path);
        if (!catalog_path.empty()) settings.catalog = catalog_path;
        if (!out_path.empty()) settings.report_path = out_path;
        if (concurrency > 0) settings.concurrency = static_cast<size_t>(concurrency);
        if (timeout > 0) settings.timeout_seconds = timeout;
        targets = load_catalog(settings.catalog);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    if (targets.empty()) {
        std::cerr << "Error: catalog has no targets\n";
        return 2;
    }

    HttpClient::Options http_opts;
    http_opts.timeout_seconds = settings.timeout_seconds;
    http_opts.connect_timeout_seconds = settings.connect_timeout_seconds;
    http_opts.follow_redirects = settings.follow_redirects;
    http_opts.max_redirects = settings.max_redirects;
    http_opts.user_agent = settings.user_agent;
    http_opts.verify_tls = settings.verify_tls;
    HttpClient client(http_opts);

    Prober::Options probe_opts;
    probe_opts.timeout_seconds = settings.timeout_seconds;
    probe_opts.user_agent = settings.user_agent;
    Prober prober(client, probe_opts);

    Classifier::Options class_opts;
    class_opts.note_limit = settings.note_limit;
    Classifier classifier(class_opts);

    ProbeRunner::Options run_opts;
    run_opts.concurrency = settings.concurrency;
    run_opts.probe_secondary = settings.probe_secondary;
    run_opts.run_id = ProbeRunner::generate_run_id();
    ProbeRunner runner(prober, classifier, run_opts);

    std::unique_ptr<logging::ChainLogger> logger;
    if (!settings.log_path.empty()) {
        logger = std::make_unique<logging::ChainLogger>(settings.log_path, run_opts.run_id);
        if (logger->is_open()) {
            runner.set_logger(logger.get());
        }
    }

    runner.on_result([](const ClassifiedResult& r) {
        std::cout << report::format_progress(r) << "\n";
    });

    std::cout << "Starting probe run: " << run_opts.run_id << "\n";
    std::cout << "Targets: " << targets.size() << ", concurrency: " << settings.concurrency << "\n";

    g_runner.store(&runner);
    std::signal(SIGINT, handle_sigint);

    Report rep;
    try {
        rep = runner.run(targets.targets());
    } catch (const std::invalid_argument& e) {
        g_runner.store(nullptr);
        std::signal(SIGINT, SIG_DFL);
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    g_runner.store(nullptr);
    std::signal(SIGINT, SIG_DFL);

    report::print_summary(rep, std::cout);

    if (report::write_json(rep, settings.report_path)) {
        std::cout << "Report written to " << settings.report_path << "\n";
    }
    if (logger && logger->is_open()) {
        std::cout << "Audit log: " << settings.log_path << "\n";
    }
    return 0;
}

/**
 * @brief Lists the targets of a catalog without probing them
 * @param argc Argument count from the command line
 * @param argv Argument values from the command line
 * @return 0 on success, 2 if the catalog cannot be loaded
 */
int cmd_catalog(int argc, char** argv) {
    std::string catalog_path;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--catalog" && i + 1 < argc) {
            catalog_path = argv[++i];
        } else {
            std::cerr << "Error: unknown argument: " << a << "\n";
            return 2;
        }
    }

    try {
        catalog::Catalog c = load_catalog(catalog_path);
        for (const auto& t : c.targets()) {
            std::cout << t.label << "  " << t.url
                      << "  [" << to_string(t.variant) << ", hint " << to_string(t.hint) << "]\n";
        }
        std::cout << c.size() << " targets\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}

/**
 * @brief Verifies the integrity of a JSONL audit log
 * @param argc Argument count from the command line
 * @param argv Argument values from the command line; argv[2] should be the log file path
 * @return 0 if verification succeeds, 1 if it fails, 2 if usage is incorrect
 */
int cmd_verify(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: apiscout verify <log-file.jsonl>\n";
        return 2;
    }

    std::string log_path = argv[2];

    std::cout << "Verifying log: " << log_path << "\n";

    if (logging::ChainLogger::verify(log_path)) {
        return 0;
    } else {
        std::cerr << "Verification failed\n";
        return 1;
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage:\n";
        std::cerr << "  apiscout probe [--config FILE] [--catalog FILE] [--out FILE] [--concurrency N] [--timeout S]\n";
        std::cerr << "  apiscout catalog [--catalog FILE]\n";
        std::cerr << "  apiscout verify <log-file.jsonl>\n";
        return 2;
    }

    std::string command = argv[1];

    if (command == "probe") {
        return cmd_probe(argc, argv);
    } else if (command == "catalog") {
        return cmd_catalog(argc, argv);
    } else if (command == "verify") {
        return cmd_verify(argc, argv);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        return 2;
    }
}
