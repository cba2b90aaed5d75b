#include "orchestrator.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>

#include "errors.hpp"

namespace page_recorder {

namespace fs = std::filesystem;

static bool validIdChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '_' || c == '-';
}

void validateRequest(const RecordingRequest& req) {
    if (req.video_id.empty()) {
        throw RecorderError(ErrorKind::Validation, "videoId is required");
    }
    if (req.video_id.size() > 128 || req.video_id.front() == '.') {
        throw RecorderError(ErrorKind::Validation, "videoId is not a valid identifier");
    }
    for (char c : req.video_id) {
        if (!validIdChar(c)) throw RecorderError(ErrorKind::Validation, "videoId is not a valid identifier");
    }
    if (req.duration_sec < kMinDurationSec || req.duration_sec > kMaxDurationSec) {
        throw RecorderError(ErrorKind::Validation,
                            "Duration must be between " + std::to_string(kMinDurationSec) + " and " +
                            std::to_string(kMaxDurationSec) + " seconds");
    }
    if (req.source_url.rfind("http://", 0) != 0 && req.source_url.rfind("https://", 0) != 0) {
        throw RecorderError(ErrorKind::Validation, "source URL must be http or https");
    }
}

const char* jobStateName(JobState s) {
    switch (s) {
        case JobState::Idle: return "idle";
        case JobState::Provisioning: return "provisioning";
        case JobState::LaunchingRenderHost: return "launching_render_host";
        case JobState::ProbingReadiness: return "probing_readiness";
        case JobState::Capturing: return "capturing";
        case JobState::Publishing: return "publishing";
        case JobState::CleaningUp: return "cleaning_up";
        case JobState::Completed: return "completed";
        case JobState::Failed: return "failed";
    }
    return "unknown";
}

JobOrchestrator::JobOrchestrator(const Config& cfg, const Services& services)
    : cfg_(cfg),
      services_(services),
      display_(cfg.display, services.spawner, services.clock),
      render_host_(cfg.render, cfg.display, services.spawner, services.inspector, services.clock),
      encoder_(cfg.encoder, cfg.display, services.spawner, services.clock) {
    if (services_.storage) {
        publisher_ = std::make_unique<ArtifactPublisher>(cfg_.publish, *services_.storage);
    }
}

JobOrchestrator::~JobOrchestrator() {
    shutdown();
    // A request thread may still be unwinding its job.
    std::unique_lock<std::mutex> lk(job_mx_);
    idle_cv_.wait(lk, [this] { return !busy_.load(); });
}

void JobOrchestrator::transition(JobContext& job, JobState next) {
    const bool stage = next != JobState::CleaningUp && next != JobState::Completed && next != JobState::Failed;
    if (stage && shutting_down_) {
        throw RecorderError(ErrorKind::ShuttingDown, "Service is shutting down");
    }
    {
        std::lock_guard<std::mutex> lk(job_mx_);
        job.state = next;
        last_state_ = next;
    }
    std::cout << "[Orchestrator] " << job.job_id << " -> " << jobStateName(next) << std::endl;
}

std::string JobOrchestrator::makeOutputPath(const std::string& video_id) const {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    fs::path p = fs::path(cfg_.output_dir) / ("recording_" + video_id + "_" + std::to_string(ms) + ".mp4");
    return p.string();
}

RecordingResult JobOrchestrator::submit(const RecordingRequest& req) {
    validateRequest(req);
    if (shutting_down_) {
        throw RecorderError(ErrorKind::ShuttingDown, "Service is shutting down");
    }

    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        throw RecorderError(ErrorKind::AdmissionBusy, "Recording already in progress");
    }
    AdmissionGuard guard(*this);

    auto job = std::make_shared<JobContext>(req, cfg_.supervisor, services_.clock);
    job->job_id = req.video_id;
    job->output_path = makeOutputPath(req.video_id);
    {
        std::lock_guard<std::mutex> lk(job_mx_);
        // shutdown() may have slipped in between the first check and admission
        if (shutting_down_) {
            throw RecorderError(ErrorKind::ShuttingDown, "Service is shutting down");
        }
        active_ = job;
    }

    std::cout << "[Orchestrator] Recording " << req.video_id << " for " << req.duration_sec
              << "s from " << req.source_url << std::endl;

    bool published = false;
    RecordingResult result;
    try {
        result = runStages(*job, published);
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] " << job->job_id << " failed in "
                  << jobStateName(job->state) << ": " << e.what() << std::endl;
        transition(*job, JobState::CleaningUp);
        cleanup(*job, false, false);
        transition(*job, JobState::Failed);
        {
            std::lock_guard<std::mutex> lk(job_mx_);
            active_.reset();
        }
        // A stage broken by the shutdown reports the shutdown.
        const auto* re = dynamic_cast<const RecorderError*>(&e);
        if (shutting_down_ && !(re && re->kind() == ErrorKind::ShuttingDown)) {
            throw RecorderError(ErrorKind::ShuttingDown, std::string("Service is shutting down: ") + e.what());
        }
        throw;
    }

    transition(*job, JobState::CleaningUp);
    cleanup(*job, true, published);
    transition(*job, JobState::Completed);
    {
        std::lock_guard<std::mutex> lk(job_mx_);
        active_.reset();
    }
    std::cout << "[Orchestrator] " << job->job_id << " done: " << result.file_size << " bytes"
              << (result.url ? ", published" : "") << std::endl;
    return result;
}

RecordingResult JobOrchestrator::runStages(JobContext& job, bool& published) {
    const RecordingRequest& req = job.request;

    transition(job, JobState::Provisioning);
    fs::create_directories(cfg_.output_dir);
    display_.start(job.supervisor);

    transition(job, JobState::LaunchingRenderHost);
    auto host = render_host_.launch(req.source_url, job.supervisor);

    transition(job, JobState::ProbingReadiness);
    render_host_.waitReady(host, job.supervisor);

    transition(job, JobState::Capturing);
    encoder_.capture(req.duration_sec, job.output_path, job.supervisor);

    std::error_code ec;
    const auto size = fs::file_size(job.output_path, ec);
    if (ec || size == 0) {
        throw RecorderError(ErrorKind::ArtifactMissing,
                            "Recording file missing or empty: " + job.output_path);
    }

    RecordingResult result;
    result.video_id = req.video_id;
    result.duration_sec = req.duration_sec;
    result.file_size = size;
    result.output_path = job.output_path;

    if (!publisher_) {
        std::cout << "[Orchestrator] Storage not configured, keeping local file only" << std::endl;
        return result;
    }

    transition(job, JobState::Publishing);
    try {
        auto artifact = publisher_->publish(job.output_path, job.job_id);
        result.url = artifact.url;
        result.url_expires_in_sec = artifact.expires_in_sec;
        published = true;
    } catch (const RecorderError& e) {
        if (e.kind() != ErrorKind::Upload) throw;
        std::cerr << "[Orchestrator] Publishing failed, returning local path: " << e.what() << std::endl;
        result.upload_error = e.what();
    }
    return result;
}

void JobOrchestrator::cleanup(JobContext& job, bool succeeded, bool published) {
    job.supervisor.terminateAll();
    if (job.supervisor.activeCount() != 0) {
        std::cerr << "[Orchestrator] " << job.supervisor.activeCount()
                  << " process(es) still tracked after cleanup" << std::endl;
    }

    std::error_code ec;
    if (!fs::exists(job.output_path, ec)) return;

    if (!succeeded || published) {
        if (fs::remove(job.output_path, ec)) {
            std::cout << "[Orchestrator] Removed " << job.output_path << std::endl;
        } else if (ec) {
            std::cerr << "[Orchestrator] Failed to remove " << job.output_path << ": " << ec.message() << std::endl;
        }
        return;
    }

    const std::string path = job.output_path;
    services_.scheduler.schedule(cfg_.retention, "remove " + path, [path]() {
        std::error_code rm_ec;
        if (fs::remove(path, rm_ec)) {
            std::cout << "[Orchestrator] Retention expired, removed " << path << std::endl;
        } else if (rm_ec) {
            std::cerr << "[Orchestrator] Failed to remove " << path << ": " << rm_ec.message() << std::endl;
        }
    });
    std::cout << "[Orchestrator] Keeping " << path << " for " << cfg_.retention.count() << " ms" << std::endl;
}

OrchestratorStatus JobOrchestrator::status() const {
    OrchestratorStatus st;
    std::lock_guard<std::mutex> lk(job_mx_);
    st.recording = busy_.load();
    if (active_) {
        st.state = active_->state;
        st.active_processes = active_->supervisor.activeCount();
        st.video_id = active_->job_id;
    } else {
        st.state = last_state_;
    }
    return st;
}

void JobOrchestrator::shutdown() {
    shutting_down_.store(true);
    std::shared_ptr<JobContext> job;
    {
        std::lock_guard<std::mutex> lk(job_mx_);
        job = active_;
    }
    if (job) {
        std::cout << "[Orchestrator] Shutdown: stopping processes of " << job->job_id << std::endl;
        job->supervisor.close();
    }
}

} // namespace page_recorder
