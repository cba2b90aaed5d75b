#include "capture_encoder.hpp"

#include <cstdlib>
#include <iostream>

#include "errors.hpp"

namespace page_recorder {

static const char* skip_spaces(const char* p) {
    while (*p == ' ') ++p;
    return p;
}

std::optional<EncoderProgress> parseProgressLine(const std::string& line) {
    auto frame_pos = line.find("frame=");
    if (frame_pos == std::string::npos) return std::nullopt;

    EncoderProgress p;
    p.frame = std::strtol(skip_spaces(line.c_str() + frame_pos + 6), nullptr, 10);

    auto fps_pos = line.find("fps=");
    if (fps_pos != std::string::npos) {
        p.fps = std::strtod(skip_spaces(line.c_str() + fps_pos + 4), nullptr);
    }
    auto time_pos = line.find("time=");
    if (time_pos != std::string::npos) {
        auto start = line.find_first_not_of(' ', time_pos + 5);
        if (start != std::string::npos) {
            auto end = line.find(' ', start);
            p.time = line.substr(start, end == std::string::npos ? std::string::npos : end - start);
        }
    }
    return p;
}

CaptureEncoder::CaptureEncoder(const EncoderConfig& cfg, const DisplayConfig& display,
                               ProcessSpawner& spawner, TimeSource& clock)
    : cfg_(cfg), display_(display), spawner_(spawner), clock_(clock) {}

SpawnSpec CaptureEncoder::buildSpec(int duration_sec, const std::string& output_path) const {
    SpawnSpec sp;
    sp.argv = {
        cfg_.binary,
        "-nostdin",
        "-f", "x11grab",
        "-video_size", display_.geometry(),
        "-framerate", std::to_string(cfg_.framerate),
        "-i", display_.display + ".0",
        "-an",
        "-c:v", "libx264",
        "-preset", cfg_.preset,
        "-crf", std::to_string(cfg_.crf),
        "-pix_fmt", "yuv420p",
        "-t", std::to_string(duration_sec),
        "-y",
        output_path
    };
    sp.env["DISPLAY"] = display_.display;
    // Progress output is for the log only.
    sp.on_output = [](const std::string& line) {
        if (auto p = parseProgressLine(line)) {
            std::cout << "[FFmpeg] frame=" << p->frame << " fps=" << p->fps << " time=" << p->time << std::endl;
        } else if (line.find("rror") != std::string::npos) {
            std::cerr << "[FFmpeg] " << line << std::endl;
        }
    };
    return sp;
}

void CaptureEncoder::capture(int duration_sec, const std::string& output_path, ProcessSupervisor& supervisor) {
    std::cout << "[FFmpeg] Recording " << duration_sec << " s to " << output_path << std::endl;

    std::shared_ptr<Process> proc;
    try {
        proc = spawner_.spawn(buildSpec(duration_sec, output_path));
    } catch (const SpawnError& e) {
        throw RecorderError(ErrorKind::Encoder, std::string("Encoder failed to start: ") + e.what(), -1);
    }
    supervisor.track(proc, "FFmpeg");

    auto limit = std::chrono::seconds(duration_sec) + cfg_.overrun;
    auto st = waitForExit(*proc, clock_, limit, cfg_.poll_interval);
    if (!st) {
        std::cerr << "[FFmpeg] Still running " << cfg_.overrun.count()
                  << " ms past the requested duration, stopping it" << std::endl;
        supervisor.terminate(proc);
        throw RecorderError(ErrorKind::Encoder, "FFmpeg did not finish in time", -1);
    }

    std::cout << "[FFmpeg] Process exited with " << st->describe() << std::endl;
    if (!st->success()) {
        int code = st->term_signal ? 128 + st->term_signal : st->exit_code;
        throw RecorderError(ErrorKind::Encoder, "FFmpeg failed with exit code " + std::to_string(code), code);
    }
}

} // namespace page_recorder
