#include "render_host.hpp"

#include <iostream>
#include <stdexcept>

#include "errors.hpp"

namespace page_recorder {

ReadinessStrategy parseReadinessStrategy(const std::string& name) {
    if (name == "strong") return ReadinessStrategy::Strong;
    if (name == "weak") return ReadinessStrategy::Weak;
    throw std::invalid_argument("unknown readiness strategy: " + name);
}

const char* readinessStrategyName(ReadinessStrategy s) {
    return s == ReadinessStrategy::Strong ? "strong" : "weak";
}

RenderHostLauncher::RenderHostLauncher(const RenderHostConfig& cfg, const DisplayConfig& display,
                                       ProcessSpawner& spawner, PageInspector& inspector, TimeSource& clock)
    : cfg_(cfg), display_(display), spawner_(spawner), inspector_(inspector), clock_(clock) {}

SpawnSpec RenderHostLauncher::buildSpec(const std::string& url) const {
    SpawnSpec sp;
    sp.argv = {
        cfg_.browser_path,
        "--display=" + display_.display,
        "--no-sandbox",
        "--disable-setuid-sandbox",
        "--disable-dev-shm-usage",
        "--disable-gpu-sandbox",
        "--use-gl=swiftshader",
        "--enable-unsafe-swiftshader",
        "--ignore-gpu-blacklist",
        "--enable-webgl",
        "--enable-accelerated-2d-canvas",
        "--disable-background-timer-throttling",
        "--disable-backgrounding-occluded-windows",
        "--disable-renderer-backgrounding",
        "--user-data-dir=" + cfg_.profile_dir,
        "--window-size=" + std::to_string(display_.width) + "," + std::to_string(display_.height),
        "--window-position=0,0",
        "--start-fullscreen",
        "--kiosk",
        "--autoplay-policy=no-user-gesture-required",
        "--disable-web-security",
        "--disable-features=VizDisplayCompositor,Translate",
        "--disable-background-networking",
        "--disable-default-apps",
        "--disable-extensions",
        "--disable-sync",
        "--disable-translate",
        "--hide-scrollbars",
        "--mute-audio",
        "--no-first-run",
        "--no-default-browser-check",
        "--remote-debugging-address=127.0.0.1",
        "--remote-debugging-port=" + std::to_string(cfg_.debugging_port),
        url
    };
    sp.env["DISPLAY"] = display_.display;
    return sp;
}

void RenderHostLauncher::checkAlive(Process& host) {
    if (auto st = host.tryWait()) {
        throw RecorderError(ErrorKind::RenderHostStart,
                            "Render host exited while waiting for the page (" + st->describe() + ")");
    }
}

void RenderHostLauncher::waitStrong(Process& host) {
    inspector_.reset();
    const unsigned max = cfg_.probe.max_attempts;

    auto confirmed = pollUntil(clock_, cfg_.probe, [&](unsigned attempt) {
        checkAlive(host);
        auto status = inspector_.inspect();
        if (!status) {
            std::cout << "[RenderHost] Check " << attempt << "/" << max << ": page not inspectable yet" << std::endl;
            return PollStep::Continue;
        }
        std::cout << "[RenderHost] Check " << attempt << "/" << max << ": " << status->summary() << std::endl;
        if (status->isRendering(cfg_.min_media_time)) return PollStep::Done;
        if (status->canvas_present && attempt > 10) {
            std::cout << "[RenderHost] Canvas present, waiting for playback..." << std::endl;
        }
        return PollStep::Continue;
    });

    if (!confirmed) {
        throw RecorderError(ErrorKind::RenderReadinessTimeout,
                            "Page failed to start rendering within " +
                            std::to_string(max * cfg_.probe.interval.count() / 1000) + " seconds");
    }

    std::cout << "[RenderHost] Rendering confirmed after " << *confirmed
              << " check(s), stabilizing for " << cfg_.stabilize.count() << " ms" << std::endl;
    clock_.sleepFor(cfg_.stabilize);
    checkAlive(host);
}

void RenderHostLauncher::waitWeak(Process& host) {
    RetryPolicy window = cfg_.probe;
    const auto step = window.interval.count() > 0 ? window.interval.count() : 1;
    window.max_attempts = static_cast<unsigned>((cfg_.weak_window.count() + step - 1) / step);
    if (window.max_attempts == 0) window.max_attempts = 1;

    pollUntil(clock_, window, [&](unsigned attempt) {
        checkAlive(host);
        return attempt >= window.max_attempts ? PollStep::Done : PollStep::Continue;
    });
    std::cout << "[RenderHost] Render host alive after " << cfg_.weak_window.count()
              << " ms, assuming the page renders" << std::endl;
}

std::shared_ptr<Process> RenderHostLauncher::launch(const std::string& url, ProcessSupervisor& supervisor) {
    std::cout << "[RenderHost] Starting browser with URL: " << url << std::endl;

    std::shared_ptr<Process> host;
    try {
        host = spawner_.spawn(buildSpec(url));
    } catch (const SpawnError& e) {
        throw RecorderError(ErrorKind::RenderHostStart, std::string("Render host failed to start: ") + e.what());
    }
    supervisor.track(host, "Chrome");
    return host;
}

void RenderHostLauncher::waitReady(const std::shared_ptr<Process>& host, ProcessSupervisor& supervisor) {
    std::cout << "[RenderHost] Waiting for the page to render (" << readinessStrategyName(cfg_.strategy)
              << " probe)" << std::endl;
    try {
        if (cfg_.strategy == ReadinessStrategy::Strong) {
            waitStrong(*host);
        } else {
            waitWeak(*host);
        }
    } catch (const RecorderError& e) {
        if (e.kind() == ErrorKind::RenderReadinessTimeout) {
            std::cerr << "[RenderHost] " << e.what() << ", stopping render host" << std::endl;
            inspector_.reset();
            supervisor.terminate(host);
        }
        throw;
    }
}

std::shared_ptr<Process> RenderHostLauncher::launchAndWaitReady(const std::string& url, ProcessSupervisor& supervisor) {
    auto host = launch(url, supervisor);
    waitReady(host, supervisor);
    return host;
}

} // namespace page_recorder
