#include "publisher.hpp"

#include <fstream>
#include <iostream>
#include <iterator>

#include "errors.hpp"

namespace page_recorder {

using json = nlohmann::json;

ArtifactPublisher::ArtifactPublisher(const PublishConfig& cfg, StorageClient& storage)
    : cfg_(cfg), storage_(storage) {}

std::string ArtifactPublisher::objectPath(const std::string& job_id) const {
    if (cfg_.object_prefix.empty()) return job_id + ".mp4";
    return cfg_.object_prefix + "/" + job_id + ".mp4";
}

PublishedArtifact ArtifactPublisher::publish(const std::string& local_path, const std::string& job_id) {
    std::ifstream in(local_path, std::ios::binary);
    if (!in) throw RecorderError(ErrorKind::Upload, "Cannot read recording " + local_path);
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    const std::string object = objectPath(job_id);
    PublishedArtifact out;
    try {
        storage_.upload(object, bytes, cfg_.content_type, cfg_.cache_control);
        out.url = storage_.createSignedUrl(object, cfg_.url_expiry_sec);
        out.expires_in_sec = cfg_.url_expiry_sec;
    } catch (const StorageError& e) {
        throw RecorderError(ErrorKind::Upload, std::string("Upload failed: ") + e.what());
    }
    std::cout << "[Publish] " << object << " uploaded, URL valid for " << out.expires_in_sec << " s" << std::endl;

    // Degraded success: the signed URL stands even if the record is not updated.
    try {
        storage_.updateRecord(job_id, json{{cfg_.url_column, out.url}});
        out.metadata_updated = true;
    } catch (const StorageError& e) {
        out.metadata_error = e.what();
        std::cerr << "[Publish] " << errorKindName(ErrorKind::MetadataUpdate) << " for " << job_id
                  << ": " << e.what() << std::endl;
    }
    return out;
}

} // namespace page_recorder
