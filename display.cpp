#include "display.hpp"

#include <iostream>

#include "errors.hpp"

namespace page_recorder {

std::string DisplayConfig::geometry() const {
    return std::to_string(width) + "x" + std::to_string(height);
}

DisplayProvisioner::DisplayProvisioner(const DisplayConfig& cfg, ProcessSpawner& spawner, TimeSource& clock)
    : cfg_(cfg), spawner_(spawner), clock_(clock) {}

SpawnSpec DisplayProvisioner::buildSpec() const {
    SpawnSpec sp;
    sp.argv = { cfg_.binary, cfg_.display, "-screen", "0",
                cfg_.geometry() + "x" + std::to_string(cfg_.depth) };
    return sp;
}

std::shared_ptr<Process> DisplayProvisioner::start(ProcessSupervisor& supervisor) {
    std::cout << "[Display] Starting " << cfg_.binary << " on " << cfg_.display
              << " (" << cfg_.geometry() << "x" << cfg_.depth << ")" << std::endl;

    std::shared_ptr<Process> proc;
    try {
        proc = spawner_.spawn(buildSpec());
    } catch (const SpawnError& e) {
        throw RecorderError(ErrorKind::DisplayStart, std::string("Virtual display failed to start: ") + e.what());
    }
    supervisor.track(proc, "Xvfb");

    // Liveness only: the display is not probed for usability.
    clock_.sleepFor(cfg_.settle);
    if (auto st = proc->tryWait()) {
        throw RecorderError(ErrorKind::DisplayStart,
                            "Virtual display exited during startup (" + st->describe() + ")");
    }

    std::cout << "[Display] " << cfg_.display << " up (pid " << proc->pid() << ")" << std::endl;
    return proc;
}

} // namespace page_recorder
