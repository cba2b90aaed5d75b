#include "page_inspector.hpp"

#include <sstream>

namespace page_recorder {

bool RenderStatus::isRendering(double min_time) const {
    return ready && playing && media_playing && current_time > min_time &&
           canvas_present && page_loaded;
}

std::string RenderStatus::summary() const {
    std::ostringstream ss;
    ss << "ready=" << ready << " playing=" << playing
       << " video=" << media_present << "/" << (media_playing ? "playing" : "paused")
       << " t=" << current_time
       << " canvas=" << canvas_present << " loaded=" << page_loaded;
    return ss.str();
}

const char* renderStatusExpression() {
    return R"JS((() => {
  const video = document.querySelector('video');
  const canvas = document.querySelector('canvas');
  return {
    ready: !!window.PREVIEW_READY,
    playing: !!window.PREVIEW_PLAYING,
    videoExists: !!video,
    videoPlaying: video ? !video.paused : false,
    currentTime: video ? video.currentTime : 0,
    hasCanvas: !!canvas,
    pageLoaded: document.readyState === 'complete'
  };
})())JS";
}

RenderStatus renderStatusFromJson(const nlohmann::json& j) {
    RenderStatus st;
    st.ready          = j.value("ready", false);
    st.playing        = j.value("playing", false);
    st.media_present  = j.value("videoExists", false);
    st.media_playing  = j.value("videoPlaying", false);
    st.current_time   = j.value("currentTime", 0.0);
    st.canvas_present = j.value("hasCanvas", false);
    st.page_loaded    = j.value("pageLoaded", false);
    return st;
}

} // namespace page_recorder
