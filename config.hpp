#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "devtools_inspector.hpp"
#include "http_server.hpp"
#include "orchestrator.hpp"
#include "storage_client.hpp"

namespace page_recorder {

struct ServiceConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 3000;

    JobOrchestrator::Config orchestrator;
    RequestRouter::Config router;
    HttpStorageClient::Config storage;
    Millis inspector_timeout{5000};

    // The inspector talks to the browser's debugging port.
    DevToolsInspector::Config inspectorConfig() const;
};

// Command line as typed; applied last.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<uint16_t> port;
    std::optional<std::string> bind_address;
    std::optional<std::string> output_dir;
    std::optional<ReadinessStrategy> readiness;
    bool help = false;
};

void printUsage(const char* argv0);

// Throws std::invalid_argument for unknown flags, missing or malformed values.
CliOptions parseCommandLine(int argc, char** argv);

// Overlays the keys present in `j`; wrong types raise nlohmann::json exceptions.
void applyConfigJson(const nlohmann::json& j, ServiceConfig& cfg);

// False when the file cannot be opened or is not valid JSON of the right shape.
bool loadConfigFile(const std::string& path, ServiceConfig& cfg);

using EnvLookup = std::function<const char*(const char*)>;

// PORT, RECORDINGS_DIR, CHROME_PROFILE_DIR, STORAGE_URL, STORAGE_SERVICE_KEY,
// STORAGE_BUCKET, PREVIEW_URL_TEMPLATE. Malformed values are logged and skipped.
void applyEnvironment(ServiceConfig& cfg, const EnvLookup& lookup);

void applyCommandLine(const CliOptions& cli, ServiceConfig& cfg);

} // namespace page_recorder
