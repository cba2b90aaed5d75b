#pragma once

#include <memory>
#include <string>

#include "clock.hpp"
#include "display.hpp"
#include "page_inspector.hpp"
#include "process.hpp"
#include "supervisor.hpp"

namespace page_recorder {

enum class ReadinessStrategy {
    Strong,  // in-page signals through the page inspector
    Weak     // render host survived a fixed window
};

// Throws std::invalid_argument for anything but "strong" / "weak".
ReadinessStrategy parseReadinessStrategy(const std::string& name);
const char* readinessStrategyName(ReadinessStrategy s);

struct RenderHostConfig {
    std::string browser_path = "/usr/bin/google-chrome";
    std::string profile_dir = "/usr/src/app/chrome-data";
    uint16_t debugging_port = 9222;

    ReadinessStrategy strategy = ReadinessStrategy::Strong;
    RetryPolicy probe{60, Millis(1000)};
    double min_media_time = 2.0;     // seconds of playback before the page counts as rendering
    Millis stabilize{3000};          // extra wait after readiness is confirmed
    Millis weak_window{10000};       // total survival window of the weak probe
};

// Launches the browser inside the virtual display and waits until the page
// really renders.
class RenderHostLauncher {
public:
    RenderHostLauncher(const RenderHostConfig& cfg, const DisplayConfig& display,
                       ProcessSpawner& spawner, PageInspector& inspector, TimeSource& clock);

    // Fixed flag set; only the URL varies per job.
    SpawnSpec buildSpec(const std::string& url) const;

    // Spawns and tracks the browser. Throws RecorderError(RenderHostStart).
    std::shared_ptr<Process> launch(const std::string& url, ProcessSupervisor& supervisor);

    // Throws RecorderError(RenderHostStart) if the browser dies while waiting,
    // RecorderError(RenderReadinessTimeout) once the probe gives up; in that
    // case the browser has already been terminated.
    void waitReady(const std::shared_ptr<Process>& host, ProcessSupervisor& supervisor);

    std::shared_ptr<Process> launchAndWaitReady(const std::string& url, ProcessSupervisor& supervisor);

private:
    void waitStrong(Process& host);
    void waitWeak(Process& host);
    void checkAlive(Process& host);

    RenderHostConfig cfg_;
    DisplayConfig display_;
    ProcessSpawner& spawner_;
    PageInspector& inspector_;
    TimeSource& clock_;
};

} // namespace page_recorder
