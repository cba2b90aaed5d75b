#pragma once

#include <memory>
#include <string>

#include "clock.hpp"
#include "process.hpp"
#include "supervisor.hpp"

namespace page_recorder {

// --------- Virtual display ---------
struct DisplayConfig {
    std::string binary = "Xvfb";
    std::string display = ":99";
    unsigned width = 1920;
    unsigned height = 1080;
    unsigned depth = 24;
    Millis settle{3000};

    std::string geometry() const;  // "1920x1080"
};

class DisplayProvisioner {
public:
    DisplayProvisioner(const DisplayConfig& cfg, ProcessSpawner& spawner, TimeSource& clock);

    SpawnSpec buildSpec() const;

    // Spawns the display, tracks it and checks it is still alive after the
    // settle window. Throws RecorderError(DisplayStart).
    std::shared_ptr<Process> start(ProcessSupervisor& supervisor);

private:
    DisplayConfig cfg_;
    ProcessSpawner& spawner_;
    TimeSource& clock_;
};

} // namespace page_recorder
