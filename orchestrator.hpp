#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "capture_encoder.hpp"
#include "clock.hpp"
#include "display.hpp"
#include "page_inspector.hpp"
#include "process.hpp"
#include "publisher.hpp"
#include "render_host.hpp"
#include "scheduler.hpp"
#include "supervisor.hpp"

namespace page_recorder {

// --------- Job data ---------
struct RecordingRequest {
    std::string video_id;
    int duration_sec = 0;
    std::string source_url;
};

constexpr int kMinDurationSec = 1;
constexpr int kMaxDurationSec = 300;

// Throws RecorderError(Validation).
void validateRequest(const RecordingRequest& req);

enum class JobState {
    Idle,
    Provisioning,
    LaunchingRenderHost,
    ProbingReadiness,
    Capturing,
    Publishing,
    CleaningUp,
    Completed,
    Failed
};

const char* jobStateName(JobState s);

struct RecordingResult {
    std::string video_id;
    int duration_sec = 0;
    std::uintmax_t file_size = 0;
    std::string output_path;
    std::optional<std::string> url;
    std::optional<int> url_expires_in_sec;
    std::optional<std::string> upload_error;
};

struct OrchestratorStatus {
    bool recording = false;
    JobState state = JobState::Idle;
    std::size_t active_processes = 0;
    std::string video_id;
};

// --------- Orchestrator ---------
class JobOrchestrator {
public:
    struct Config {
        std::string output_dir = "/usr/src/app/recordings";
        Millis retention{60000};    // unpublished recordings are kept this long

        DisplayConfig display;
        RenderHostConfig render;
        EncoderConfig encoder;
        PublishConfig publish;
        ProcessSupervisor::Config supervisor;
    };

    // Collaborators are borrowed; `storage` may be null (publishing skipped).
    struct Services {
        ProcessSpawner& spawner;
        TimeSource& clock;
        PageInspector& inspector;
        DeferredScheduler& scheduler;
        StorageClient* storage = nullptr;
    };

    JobOrchestrator(const Config& cfg, const Services& services);
    ~JobOrchestrator();

    JobOrchestrator(const JobOrchestrator&) = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    // Runs one recording job to completion. Throws RecorderError with kind
    // Validation, AdmissionBusy, ShuttingDown, or the kind of the failed stage.
    RecordingResult submit(const RecordingRequest& req);

    OrchestratorStatus status() const;

    // Signal path: refuses new jobs, stops every process of the active job and
    // any it starts later; the job fails before its next stage.
    void shutdown();
    bool shuttingDown() const { return shutting_down_.load(); }

private:
    struct JobContext {
        JobContext(const RecordingRequest& r, const ProcessSupervisor::Config& sc, TimeSource& clock)
            : request(r), supervisor(sc, clock) {}

        RecordingRequest request;
        std::string job_id;
        std::string output_path;
        ProcessSupervisor supervisor;
        JobState state = JobState::Idle;
    };

    // Clears the admission flag on every exit path and wakes the destructor.
    class AdmissionGuard {
    public:
        explicit AdmissionGuard(JobOrchestrator& owner) : owner_(owner) {}
        ~AdmissionGuard() {
            std::lock_guard<std::mutex> lk(owner_.job_mx_);
            owner_.busy_.store(false);
            owner_.idle_cv_.notify_all();
        }
        AdmissionGuard(const AdmissionGuard&) = delete;
        AdmissionGuard& operator=(const AdmissionGuard&) = delete;
    private:
        JobOrchestrator& owner_;
    };

    void transition(JobContext& job, JobState next);
    RecordingResult runStages(JobContext& job, bool& published);
    void cleanup(JobContext& job, bool succeeded, bool published);
    std::string makeOutputPath(const std::string& video_id) const;

    Config cfg_;
    Services services_;
    DisplayProvisioner display_;
    RenderHostLauncher render_host_;
    CaptureEncoder encoder_;
    std::unique_ptr<ArtifactPublisher> publisher_;

    std::atomic<bool> busy_{false};
    std::atomic<bool> shutting_down_{false};

    mutable std::mutex job_mx_;
    std::condition_variable idle_cv_;
    std::shared_ptr<JobContext> active_;
    JobState last_state_ = JobState::Idle;
};

} // namespace page_recorder
