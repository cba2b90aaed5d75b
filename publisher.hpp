#pragma once

#include <optional>
#include <string>

#include "storage_client.hpp"

namespace page_recorder {

struct PublishConfig {
    std::string object_prefix = "recordings";
    std::string content_type = "video/mp4";
    std::string cache_control = "max-age=3600";
    int url_expiry_sec = 3600;
    std::string url_column = "video_url";   // metadata field receiving the signed URL
};

struct PublishedArtifact {
    std::string url;
    int expires_in_sec = 0;
    bool metadata_updated = false;
    std::optional<std::string> metadata_error;
};

class ArtifactPublisher {
public:
    ArtifactPublisher(const PublishConfig& cfg, StorageClient& storage);

    std::string objectPath(const std::string& job_id) const;

    // Throws RecorderError(Upload) if the file cannot be read, uploaded or
    // signed. A failed metadata update is only logged.
    PublishedArtifact publish(const std::string& local_path, const std::string& job_id);

private:
    PublishConfig cfg_;
    StorageClient& storage_;
};

} // namespace page_recorder
