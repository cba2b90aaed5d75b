#include "http_server.hpp"

#include <atomic>
#include <chrono>
#include <climits>
#include <condition_variable>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <set>

#include "errors.hpp"

namespace page_recorder {

using json = nlohmann::json;
using tcp = boost::asio::ip::tcp;
namespace beast = boost::beast;
namespace net = boost::asio;

// --------------------------- helpers -----------------------------------------
std::string isoTimestampUtc() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
    return out;
}

HttpResponse makeJsonResponse(const HttpRequest& req, http::status status, const json& body) {
    HttpResponse res{status, req.version()};
    res.set(http::field::server, "page-recorder");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

static std::string substituteVideoId(std::string tmpl, const std::string& video_id) {
    static const std::string kToken = "{videoId}";
    for (auto pos = tmpl.find(kToken); pos != std::string::npos; pos = tmpl.find(kToken, pos + video_id.size())) {
        tmpl.replace(pos, kToken.size(), video_id);
    }
    return tmpl;
}

// --------------------------- router ------------------------------------------
RequestRouter::RequestRouter(const Config& cfg, JobOrchestrator& orchestrator)
    : cfg_(cfg), orchestrator_(orchestrator) {}

RecordingRequest RequestRouter::parseRecordingRequest(const json& body) const {
    if (!body.is_object()) {
        throw RecorderError(ErrorKind::Validation, "Request body must be a JSON object");
    }
    if (!body.contains("videoId") || !body.contains("duration") ||
        body["videoId"].is_null() || body["duration"].is_null()) {
        throw RecorderError(ErrorKind::Validation, "videoId and duration are required");
    }

    const auto& id = body["videoId"];
    if (!id.is_string()) {
        throw RecorderError(ErrorKind::Validation, "videoId must be a string");
    }
    const auto& dur = body["duration"];
    if (!dur.is_number_integer()) {
        throw RecorderError(ErrorKind::Validation, "duration must be an integer number of seconds");
    }

    RecordingRequest req;
    req.video_id = id.get<std::string>();

    // Keep out-of-range values out of int before validation sees them.
    if (dur.is_number_unsigned()) {
        const auto v = dur.get<unsigned long long>();
        req.duration_sec = v > static_cast<unsigned long long>(INT_MAX) ? INT_MAX : static_cast<int>(v);
    } else {
        const auto v = dur.get<long long>();
        req.duration_sec = v < INT_MIN ? INT_MIN : (v > INT_MAX ? INT_MAX : static_cast<int>(v));
    }

    if (body.contains("previewUrl") && !body["previewUrl"].is_null()) {
        if (!body["previewUrl"].is_string()) {
            throw RecorderError(ErrorKind::Validation, "previewUrl must be a string");
        }
        req.source_url = body["previewUrl"].get<std::string>();
    } else if (!cfg_.preview_url_template.empty()) {
        req.source_url = substituteVideoId(cfg_.preview_url_template, req.video_id);
    } else {
        throw RecorderError(ErrorKind::Validation, "previewUrl is required");
    }
    return req;
}

HttpResponse RequestRouter::handle(const HttpRequest& req) {
    std::string target(req.target());
    const auto q = target.find('?');
    if (q != std::string::npos) target.erase(q);

    if (target == "/record-video") {
        if (req.method() != http::verb::post) {
            return makeJsonResponse(req, http::status::method_not_allowed, {{"error", "Method not allowed"}});
        }
        return recordVideo(req);
    }
    if (target == "/health") {
        if (req.method() != http::verb::get) {
            return makeJsonResponse(req, http::status::method_not_allowed, {{"error", "Method not allowed"}});
        }
        return health(req);
    }
    if (target == "/") {
        if (req.method() != http::verb::get) {
            return makeJsonResponse(req, http::status::method_not_allowed, {{"error", "Method not allowed"}});
        }
        return index(req);
    }
    return makeJsonResponse(req, http::status::not_found, {{"error", "Not found"}});
}

HttpResponse RequestRouter::recordVideo(const HttpRequest& req) {
    auto body = json::parse(req.body(), nullptr, false);
    if (body.is_discarded()) {
        return makeJsonResponse(req, http::status::bad_request, {{"error", "Invalid JSON body"}});
    }

    try {
        const RecordingRequest rec = parseRecordingRequest(body);
        const RecordingResult result = orchestrator_.submit(rec);

        json out = {
            {"success", true},
            {"message", "Video recorded successfully"},
            {"videoId", result.video_id},
            {"duration", result.duration_sec},
            {"fileSize", result.file_size},
            {"outputPath", result.output_path}
        };
        if (result.url) out["url"] = *result.url;
        if (result.url_expires_in_sec) out["expiresIn"] = *result.url_expires_in_sec;
        if (result.upload_error) out["uploadError"] = *result.upload_error;
        return makeJsonResponse(req, http::status::ok, out);
    } catch (const RecorderError& e) {
        switch (e.kind()) {
            case ErrorKind::Validation:
                return makeJsonResponse(req, http::status::bad_request, {{"error", e.what()}});
            case ErrorKind::AdmissionBusy:
                return makeJsonResponse(req, http::status::too_many_requests,
                                        {{"error", "Recording already in progress"}});
            case ErrorKind::ShuttingDown:
                return makeJsonResponse(req, http::status::service_unavailable, {{"error", e.what()}});
            default:
                std::cerr << "[HTTP] Recording failed (" << errorKindName(e.kind()) << "): " << e.what() << std::endl;
                return makeJsonResponse(req, http::status::internal_server_error,
                                        {{"success", false}, {"error", "Recording failed"}, {"message", e.what()}});
        }
    } catch (const std::exception& e) {
        std::cerr << "[HTTP] Recording failed: " << e.what() << std::endl;
        return makeJsonResponse(req, http::status::internal_server_error,
                                {{"success", false}, {"error", "Recording failed"}, {"message", e.what()}});
    }
}

HttpResponse RequestRouter::health(const HttpRequest& req) const {
    const OrchestratorStatus st = orchestrator_.status();
    return makeJsonResponse(req, http::status::ok, {
        {"status", "healthy"},
        {"isRecording", st.recording},
        {"state", jobStateName(st.state)},
        {"timestamp", isoTimestampUtc()},
        {"activeProcesses", st.active_processes}
    });
}

HttpResponse RequestRouter::index(const HttpRequest& req) const {
    return makeJsonResponse(req, http::status::ok, {
        {"service", cfg_.service_name},
        {"status", "running"},
        {"endpoints", {
            {"POST /record-video", "Record a video with {videoId, duration, previewUrl?}"},
            {"GET /health", "Health check"}
        }}
    });
}

// --------------------------- server ------------------------------------------
struct HttpServer::Impl {
    explicit Impl(RequestRouter& r) : router(r), ioc(1) {}

    RequestRouter& router;
    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::atomic<bool> running{false};
    std::atomic<uint16_t> bound_port{0};

    std::mutex sessions_mx;
    std::condition_variable sessions_cv;
    std::set<tcp::socket*> sessions;

    void serve(tcp::socket& sock) {
        beast::flat_buffer buffer;
        beast::error_code ec;

        while (running.load()) {
            HttpRequest req;
            http::read(sock, buffer, req, ec);
            if (ec == http::error::end_of_stream) break;
            if (ec) {
                if (ec != net::error::operation_aborted && ec != net::error::connection_reset &&
                    ec != net::error::bad_descriptor) {
                    std::cerr << "[HTTP] read: " << ec.message() << std::endl;
                }
                break;
            }

            std::cout << "[HTTP] " << req.method_string() << " " << req.target() << std::endl;
            HttpResponse res;
            try {
                res = router.handle(req);
            } catch (const std::exception& e) {
                std::cerr << "[HTTP] handler error: " << e.what() << std::endl;
                res = makeJsonResponse(req, http::status::internal_server_error, {{"error", e.what()}});
            }

            const bool keep_alive = res.keep_alive();
            http::write(sock, res, ec);
            if (ec) {
                std::cerr << "[HTTP] write: " << ec.message() << std::endl;
                break;
            }
            if (!keep_alive) break;
        }

        sock.shutdown(tcp::socket::shutdown_send, ec);
    }

    void doAccept(const std::shared_ptr<Impl>& self) {
        acceptor->async_accept([this, self](beast::error_code ec, tcp::socket socket) {
            if (!running.load()) return;

            if (!ec) {
                std::thread([self, sock = std::move(socket)]() mutable {
                    {
                        std::lock_guard<std::mutex> lk(self->sessions_mx);
                        self->sessions.insert(&sock);
                    }
                    try {
                        self->serve(sock);
                    } catch (const std::exception& e) {
                        std::cerr << "[HTTP] session crashed: " << e.what() << std::endl;
                    }
                    {
                        std::lock_guard<std::mutex> lk(self->sessions_mx);
                        self->sessions.erase(&sock);
                    }
                    self->sessions_cv.notify_all();
                }).detach();
            } else {
                std::cerr << "[HTTP] accept: " << ec.message() << std::endl;
            }
            doAccept(self);
        });
    }

    // Unblocks sessions waiting in read() and waits for them to finish.
    void closeSessions(std::chrono::seconds limit) {
        std::unique_lock<std::mutex> lk(sessions_mx);
        for (auto* s : sessions) {
            beast::error_code ec;
            s->shutdown(tcp::socket::shutdown_both, ec);
        }
        if (!sessions_cv.wait_for(lk, limit, [this] { return sessions.empty(); })) {
            std::cerr << "[HTTP] " << sessions.size() << " session(s) still open at shutdown" << std::endl;
        }
    }
};

HttpServer::HttpServer(RequestRouter& router)
    : impl_(std::make_shared<Impl>(router)) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(const std::string& bind_address, uint16_t port) {
    if (impl_->running.exchange(true)) return true;

    beast::error_code ec;
    auto address = net::ip::make_address(bind_address, ec);
    if (ec) {
        std::cerr << "[HTTP] bad bind address '" << bind_address << "': " << ec.message() << std::endl;
        impl_->running = false;
        return false;
    }

    impl_->acceptor = std::make_unique<tcp::acceptor>(impl_->ioc);
    tcp::endpoint endpoint{address, port};

    auto fail = [&](const char* what) {
        std::cerr << "[HTTP] " << what << ": " << ec.message() << std::endl;
        impl_->acceptor.reset();
        impl_->running = false;
        return false;
    };

    impl_->acceptor->open(endpoint.protocol(), ec);
    if (ec) return fail("acceptor open");

    impl_->acceptor->set_option(net::socket_base::reuse_address(true), ec);
    if (ec) return fail("set_option");

    impl_->acceptor->bind(endpoint, ec);
    if (ec) return fail("bind");

    impl_->acceptor->listen(net::socket_base::max_listen_connections, ec);
    if (ec) return fail("listen");

    impl_->bound_port = impl_->acceptor->local_endpoint().port();
    impl_->doAccept(impl_);

    io_thread_ = std::thread([impl = impl_, bind_address]() {
        std::cout << "[HTTP] Listening on " << bind_address << ":" << impl->bound_port << std::endl;
        impl->ioc.run();
    });
    return true;
}

void HttpServer::stop() {
    if (!impl_->running.exchange(false)) return;
    impl_->ioc.stop();
    if (io_thread_.joinable()) io_thread_.join();

    // Let the pending accept complete as aborted so it drops its reference.
    beast::error_code ec;
    if (impl_->acceptor) impl_->acceptor->close(ec);
    impl_->ioc.restart();
    impl_->ioc.poll();

    impl_->closeSessions(std::chrono::seconds(30));
    std::cout << "[HTTP] Server stopped" << std::endl;
}

uint16_t HttpServer::port() const {
    return impl_->bound_port.load();
}

} // namespace page_recorder
