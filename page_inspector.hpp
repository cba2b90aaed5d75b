#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace page_recorder {

// One sample of in-page render state.
struct RenderStatus {
    bool   ready = false;          // window.PREVIEW_READY
    bool   playing = false;        // window.PREVIEW_PLAYING
    bool   media_present = false;  // a <video> element exists
    bool   media_playing = false;  // ... and is not paused
    double current_time = 0.0;     // its playback position in seconds
    bool   canvas_present = false; // a <canvas> element exists
    bool   page_loaded = false;    // document.readyState == "complete"

    // All signals present and the media element advanced past `min_time`.
    bool isRendering(double min_time) const;
    std::string summary() const;
};

// JavaScript expression evaluated in the page; yields the object parsed by
// renderStatusFromJson().
const char* renderStatusExpression();

// Throws nlohmann::json::exception on a malformed object.
RenderStatus renderStatusFromJson(const nlohmann::json& j);

class PageInspector {
public:
    virtual ~PageInspector() = default;
    // Drops any connection to a previous render host.
    virtual void reset() = 0;
    // nullopt when the page could not be inspected this time.
    virtual std::optional<RenderStatus> inspect() = 0;
};

} // namespace page_recorder
