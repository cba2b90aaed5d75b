// main.cpp - page recording service
//
// Example config (config.json):
// {
//   "port": 3000,
//   "bind": "0.0.0.0",
//   "output_dir": "/usr/src/app/recordings",
//   "retention_ms": 60000,
//   "preview_url_template": "https://app.deckoholic.ai/preview-headless/{videoId}?autoplay=true",
//
//   "display":  { "display": ":99", "width": 1920, "height": 1080, "depth": 24, "settle_ms": 3000 },
//   "browser":  { "path": "/usr/bin/google-chrome", "profile_dir": "/usr/src/app/chrome-data",
//                 "debugging_port": 9222, "readiness": "strong",
//                 "probe_attempts": 60, "probe_interval_ms": 1000, "stabilize_ms": 3000 },
//   "encoder":  { "framerate": 30, "preset": "ultrafast", "crf": 28, "overrun_ms": 30000 },
//   "supervisor": { "grace_ms": 5000 },
//   "storage":  { "url": "https://project.example.co", "service_key": "...", "bucket": "videos" },
//   "publish":  { "object_prefix": "recordings", "url_expiry_sec": 3600 }
// }

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <boost/asio.hpp>

#include "config.hpp"
#include "devtools_inspector.hpp"
#include "http_server.hpp"
#include "orchestrator.hpp"
#include "process.hpp"
#include "scheduler.hpp"
#include "storage_client.hpp"

int main(int argc, char** argv) {
    using namespace page_recorder;

    // -------------------------- CLI parse --------------------------
    CliOptions cli;
    try {
        cli = parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }
    if (cli.help) {
        printUsage(argv[0]);
        return 0;
    }

    // -------------------------- Config layers --------------------------
    ServiceConfig cfg;
    if (cli.config_path && !loadConfigFile(*cli.config_path, cfg)) {
        return 2;
    }
    applyEnvironment(cfg, [](const char* name) { return std::getenv(name); });
    applyCommandLine(cli, cfg);

    // -------------------------- Services --------------------------
    PosixSpawner spawner;
    SteadyTimeSource clock;
    DevToolsInspector inspector(cfg.inspectorConfig());
    AsioScheduler scheduler;

    std::unique_ptr<HttpStorageClient> storage;
    if (HttpStorageClient::isConfigured(cfg.storage)) {
        try {
            storage = std::make_unique<HttpStorageClient>(cfg.storage);
            std::cout << "[Main] Publishing to " << cfg.storage.endpoint
                      << " (bucket " << cfg.storage.bucket << ")" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[Main] Invalid storage configuration: " << e.what() << std::endl;
            return 2;
        }
    } else {
        std::cout << "[Main] Storage not configured, recordings stay local" << std::endl;
    }

    JobOrchestrator orchestrator(cfg.orchestrator,
                                 JobOrchestrator::Services{spawner, clock, inspector, scheduler, storage.get()});
    RequestRouter router(cfg.router, orchestrator);
    HttpServer server(router);

    if (!server.start(cfg.bind_address, cfg.port)) {
        std::cerr << "[Main] Failed to start HTTP server" << std::endl;
        return 1;
    }
    std::cout << "[Main] Video recording service running on port " << server.port()
              << " (readiness: " << readinessStrategyName(cfg.orchestrator.render.strategy) << ")" << std::endl;

    // -------------------------- Signals --------------------------
    boost::asio::io_context signal_ioc;
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        std::cout << "\n[Signal] " << (sig == SIGINT ? "SIGINT" : "SIGTERM")
                  << " received, cleaning up..." << std::endl;
        orchestrator.shutdown();
    });
    signal_ioc.run();

    server.stop();
    std::cout << "[Main] Bye" << std::endl;
    return 0;
}
