#pragma once

#include <optional>
#include <string>

#include "clock.hpp"
#include "display.hpp"
#include "process.hpp"
#include "supervisor.hpp"

namespace page_recorder {

struct EncoderConfig {
    std::string binary = "ffmpeg";
    unsigned framerate = 30;
    std::string preset = "ultrafast";
    unsigned crf = 28;
    Millis overrun{30000};     // allowed time past the requested duration
    Millis poll_interval{250};
};

// One parsed "frame= ... fps= ... time=..." progress line.
struct EncoderProgress {
    long frame = 0;
    double fps = 0.0;
    std::string time;
};

std::optional<EncoderProgress> parseProgressLine(const std::string& line);

class CaptureEncoder {
public:
    CaptureEncoder(const EncoderConfig& cfg, const DisplayConfig& display,
                   ProcessSpawner& spawner, TimeSource& clock);

    SpawnSpec buildSpec(int duration_sec, const std::string& output_path) const;

    // Records the display for `duration_sec` seconds and returns once the
    // encoder exited with code 0. Throws RecorderError(Encoder) otherwise.
    void capture(int duration_sec, const std::string& output_path, ProcessSupervisor& supervisor);

private:
    EncoderConfig cfg_;
    DisplayConfig display_;
    ProcessSpawner& spawner_;
    TimeSource& clock_;
};

} // namespace page_recorder
