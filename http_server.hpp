#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "orchestrator.hpp"

namespace page_recorder {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// Maps HTTP requests onto the orchestrator. Independent of sockets.
class RequestRouter {
public:
    struct Config {
        std::string service_name = "Video Recording Service";
        // "{videoId}" is replaced by the request's videoId when no previewUrl is sent
        std::string preview_url_template = "https://app.deckoholic.ai/preview-headless/{videoId}?autoplay=true";
    };

    RequestRouter(const Config& cfg, JobOrchestrator& orchestrator);

    HttpResponse handle(const HttpRequest& req);

    // Throws RecorderError(Validation) for missing fields or wrong types.
    RecordingRequest parseRecordingRequest(const nlohmann::json& body) const;

private:
    HttpResponse recordVideo(const HttpRequest& req);
    HttpResponse health(const HttpRequest& req) const;
    HttpResponse index(const HttpRequest& req) const;

    Config cfg_;
    JobOrchestrator& orchestrator_;
};

HttpResponse makeJsonResponse(const HttpRequest& req, http::status status, const nlohmann::json& body);

// "2026-10-19T08:15:30.123Z"
std::string isoTimestampUtc();

// Plain HTTP/1.1 server: async accept on one io thread, each connection
// served synchronously on its own detached thread.
class HttpServer {
public:
    explicit HttpServer(RequestRouter& router);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Port 0 picks a free port; see port().
    bool start(const std::string& bind_address, uint16_t port);
    void stop();
    uint16_t port() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
    std::thread io_thread_;
};

} // namespace page_recorder
