#include "config.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace page_recorder {

using json = nlohmann::json;

DevToolsInspector::Config ServiceConfig::inspectorConfig() const {
    DevToolsInspector::Config c;
    c.port = orchestrator.render.debugging_port;
    c.timeout = inspector_timeout;
    return c;
}

void printUsage(const char* argv0) {
    std::cerr <<
    "Usage:\n"
    "  " << argv0 << " [--config FILE.json]\n"
    "               [--port N] [--bind ADDRESS]\n"
    "               [--out-dir DIR]\n"
    "               [--readiness strong|weak]\n"
    "               [--help]\n"
    "\n"
    "Environment: PORT, RECORDINGS_DIR, CHROME_PROFILE_DIR, STORAGE_URL,\n"
    "             STORAGE_SERVICE_KEY, STORAGE_BUCKET, PREVIEW_URL_TEMPLATE\n";
}

static uint16_t parsePort(const std::string& s) {
    std::size_t used = 0;
    unsigned long v = 0;
    try {
        v = std::stoul(s, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid port: " + s);
    }
    if (used != s.size() || v == 0 || v > 65535) throw std::invalid_argument("invalid port: " + s);
    return static_cast<uint16_t>(v);
}

CliOptions parseCommandLine(int argc, char** argv) {
    CliOptions cli;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto need = [&](const char* name) {
            if (i + 1 >= argc) throw std::invalid_argument(std::string(name) + " requires value");
            return std::string(argv[++i]);
        };
        if (a == "--config") cli.config_path = need("--config");
        else if (a == "--port") cli.port = parsePort(need("--port"));
        else if (a == "--bind") cli.bind_address = need("--bind");
        else if (a == "--out-dir") cli.output_dir = need("--out-dir");
        else if (a == "--readiness") cli.readiness = parseReadinessStrategy(need("--readiness"));
        else if (a == "--help" || a == "-h") cli.help = true;
        else throw std::invalid_argument("Unknown arg: " + a);
    }
    return cli;
}

static Millis millisAt(const json& j, const char* key, Millis fallback) {
    return j.contains(key) ? Millis(j[key].get<long long>()) : fallback;
}

void applyConfigJson(const json& j, ServiceConfig& cfg) {
    auto& oc = cfg.orchestrator;

    if (j.contains("port")) cfg.port = j["port"].get<uint16_t>();
    if (j.contains("bind")) cfg.bind_address = j["bind"].get<std::string>();
    if (j.contains("output_dir")) oc.output_dir = j["output_dir"].get<std::string>();
    oc.retention = millisAt(j, "retention_ms", oc.retention);
    if (j.contains("preview_url_template")) cfg.router.preview_url_template = j["preview_url_template"].get<std::string>();
    if (j.contains("service_name")) cfg.router.service_name = j["service_name"].get<std::string>();

    if (j.contains("display") && j["display"].is_object()) {
        const auto& d = j["display"];
        if (d.contains("binary")) oc.display.binary = d["binary"].get<std::string>();
        if (d.contains("display")) oc.display.display = d["display"].get<std::string>();
        if (d.contains("width")) oc.display.width = d["width"].get<unsigned>();
        if (d.contains("height")) oc.display.height = d["height"].get<unsigned>();
        if (d.contains("depth")) oc.display.depth = d["depth"].get<unsigned>();
        oc.display.settle = millisAt(d, "settle_ms", oc.display.settle);
    }

    if (j.contains("browser") && j["browser"].is_object()) {
        const auto& b = j["browser"];
        auto& r = oc.render;
        if (b.contains("path")) r.browser_path = b["path"].get<std::string>();
        if (b.contains("profile_dir")) r.profile_dir = b["profile_dir"].get<std::string>();
        if (b.contains("debugging_port")) r.debugging_port = b["debugging_port"].get<uint16_t>();
        if (b.contains("readiness")) r.strategy = parseReadinessStrategy(b["readiness"].get<std::string>());
        if (b.contains("probe_attempts")) r.probe.max_attempts = b["probe_attempts"].get<unsigned>();
        r.probe.interval = millisAt(b, "probe_interval_ms", r.probe.interval);
        if (b.contains("min_media_time")) r.min_media_time = b["min_media_time"].get<double>();
        r.stabilize = millisAt(b, "stabilize_ms", r.stabilize);
        r.weak_window = millisAt(b, "weak_window_ms", r.weak_window);
        cfg.inspector_timeout = millisAt(b, "inspector_timeout_ms", cfg.inspector_timeout);
    }

    if (j.contains("encoder") && j["encoder"].is_object()) {
        const auto& e = j["encoder"];
        if (e.contains("binary")) oc.encoder.binary = e["binary"].get<std::string>();
        if (e.contains("framerate")) oc.encoder.framerate = e["framerate"].get<unsigned>();
        if (e.contains("preset")) oc.encoder.preset = e["preset"].get<std::string>();
        if (e.contains("crf")) oc.encoder.crf = e["crf"].get<unsigned>();
        oc.encoder.overrun = millisAt(e, "overrun_ms", oc.encoder.overrun);
    }

    if (j.contains("supervisor") && j["supervisor"].is_object()) {
        const auto& s = j["supervisor"];
        oc.supervisor.grace = millisAt(s, "grace_ms", oc.supervisor.grace);
        oc.supervisor.poll_interval = millisAt(s, "poll_interval_ms", oc.supervisor.poll_interval);
    }

    if (j.contains("storage") && j["storage"].is_object()) {
        const auto& s = j["storage"];
        if (s.contains("url")) cfg.storage.endpoint = s["url"].get<std::string>();
        if (s.contains("service_key")) cfg.storage.service_key = s["service_key"].get<std::string>();
        if (s.contains("bucket")) cfg.storage.bucket = s["bucket"].get<std::string>();
        if (s.contains("table")) cfg.storage.table = s["table"].get<std::string>();
        cfg.storage.timeout = millisAt(s, "timeout_ms", cfg.storage.timeout);
    }

    if (j.contains("publish") && j["publish"].is_object()) {
        const auto& p = j["publish"];
        if (p.contains("object_prefix")) oc.publish.object_prefix = p["object_prefix"].get<std::string>();
        if (p.contains("cache_control")) oc.publish.cache_control = p["cache_control"].get<std::string>();
        if (p.contains("url_expiry_sec")) oc.publish.url_expiry_sec = p["url_expiry_sec"].get<int>();
        if (p.contains("url_column")) oc.publish.url_column = p["url_column"].get<std::string>();
    }
}

bool loadConfigFile(const std::string& path, ServiceConfig& cfg) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[Config] Cannot open: " << path << std::endl;
        return false;
    }
    try {
        json j; f >> j;
        if (!j.is_object()) {
            std::cerr << "[Config] " << path << ": top level must be an object" << std::endl;
            return false;
        }
        applyConfigJson(j, cfg);
    } catch (const json::exception& e) {
        std::cerr << "[Config] " << path << ": " << e.what() << std::endl;
        return false;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Config] " << path << ": " << e.what() << std::endl;
        return false;
    }
    std::cout << "[Config] Loaded " << path << std::endl;
    return true;
}

void applyEnvironment(ServiceConfig& cfg, const EnvLookup& lookup) {
    auto get = [&](const char* name) -> std::optional<std::string> {
        const char* v = lookup(name);
        if (!v || !*v) return std::nullopt;
        return std::string(v);
    };

    if (auto v = get("PORT")) {
        try {
            cfg.port = parsePort(*v);
        } catch (const std::invalid_argument& e) {
            std::cerr << "[Config] Ignoring PORT: " << e.what() << std::endl;
        }
    }
    if (auto v = get("RECORDINGS_DIR")) cfg.orchestrator.output_dir = *v;
    if (auto v = get("CHROME_PROFILE_DIR")) cfg.orchestrator.render.profile_dir = *v;
    if (auto v = get("STORAGE_URL")) cfg.storage.endpoint = *v;
    if (auto v = get("STORAGE_SERVICE_KEY")) cfg.storage.service_key = *v;
    if (auto v = get("STORAGE_BUCKET")) cfg.storage.bucket = *v;
    if (auto v = get("PREVIEW_URL_TEMPLATE")) cfg.router.preview_url_template = *v;
}

void applyCommandLine(const CliOptions& cli, ServiceConfig& cfg) {
    if (cli.port) cfg.port = *cli.port;
    if (cli.bind_address) cfg.bind_address = *cli.bind_address;
    if (cli.output_dir) cfg.orchestrator.output_dir = *cli.output_dir;
    if (cli.readiness) cfg.orchestrator.render.strategy = *cli.readiness;
}

} // namespace page_recorder
