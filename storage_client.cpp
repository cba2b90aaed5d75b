#include "storage_client.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>

#include <iostream>

#include "errors.hpp"
#include "net_deadline.hpp"

namespace page_recorder {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

namespace {

// Write the request and read the answer on an already connected stream.
template <class Stream>
void exchange(net::io_context& ioc, Stream& stream,
              http::request<http::string_body>& req, http::response<http::string_body>& res,
              Clock::time_point deadline, const std::function<void()>& abort) {
    beast::error_code ec = net::error::would_block;
    http::async_write(stream, req, [&](beast::error_code e, std::size_t) { ec = e; });
    runWithDeadline(ioc, ec, deadline - Clock::now(), abort);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(16 * 1024 * 1024);
    ec = net::error::would_block;
    http::async_read(stream, buffer, parser, [&](beast::error_code e, std::size_t) { ec = e; });
    runWithDeadline(ioc, ec, deadline - Clock::now(), abort);
    res = parser.release();
}

std::string excerpt(const std::string& body) {
    return body.size() > 300 ? body.substr(0, 300) + "..." : body;
}

} // namespace

HttpStorageClient::HttpStorageClient(const Config& cfg) : cfg_(cfg) {
    try {
        base_ = parseUrl(cfg_.endpoint);
    } catch (const std::invalid_argument& e) {
        throw StorageError(std::string("bad storage endpoint: ") + e.what());
    }
    if (base_.path.size() > 1 && base_.path.back() == '/') base_.path.pop_back();
    if (base_.path == "/") base_.path.clear();

    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

bool HttpStorageClient::isConfigured(const Config& cfg) {
    return !cfg.endpoint.empty() && !cfg.service_key.empty();
}

HttpStorageClient::Request HttpStorageClient::makeRequest(http::verb verb, const std::string& path,
                                                          const std::string& content_type, std::string body) const {
    Request req{verb, base_.path + path, 11};
    req.set(http::field::host, base_.hostHeader());
    req.set(http::field::user_agent, "Page-Recorder/1.0");
    req.set(http::field::authorization, "Bearer " + cfg_.service_key);
    req.set("apikey", cfg_.service_key);
    if (!content_type.empty()) req.set(http::field::content_type, content_type);
    req.body() = std::move(body);
    req.prepare_payload();
    return req;
}

HttpStorageClient::Response HttpStorageClient::send(Request& req) {
    const std::string what = std::string(req.method_string()) + " " + std::string(req.target());
    const auto deadline = Clock::now() + cfg_.timeout;
    net::io_context ioc;

    beast::error_code ec;
    tcp::resolver resolver(ioc);
    auto results = resolver.resolve(base_.host, std::to_string(base_.port), ec);
    if (ec) throw StorageError("cannot resolve " + base_.host + ": " + ec.message());

    Response res;
    try {
        if (base_.use_ssl) {
            beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx_);
            auto abort = [&stream]() {
                beast::error_code ignore;
                beast::get_lowest_layer(stream).socket().close(ignore);
            };

            // Set SNI Hostname
            if (!SSL_set_tlsext_host_name(stream.native_handle(), base_.host.c_str())) {
                beast::error_code sni{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                throw beast::system_error{sni};
            }
            stream.set_verify_callback(ssl::host_name_verification(base_.host));

            ec = net::error::would_block;
            beast::get_lowest_layer(stream).async_connect(results, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
            runWithDeadline(ioc, ec, deadline - Clock::now(), abort);

            ec = net::error::would_block;
            stream.async_handshake(ssl::stream_base::client, [&](beast::error_code e) { ec = e; });
            runWithDeadline(ioc, ec, deadline - Clock::now(), abort);

            exchange(ioc, stream, req, res, deadline, abort);
            abort();
        } else {
            beast::tcp_stream stream(ioc);
            auto abort = [&stream]() {
                beast::error_code ignore;
                stream.socket().close(ignore);
            };

            ec = net::error::would_block;
            stream.async_connect(results, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
            runWithDeadline(ioc, ec, deadline - Clock::now(), abort);

            exchange(ioc, stream, req, res, deadline, abort);
            abort();
        }
    } catch (const beast::system_error& se) {
        throw StorageError(what + ": " + se.code().message());
    }
    return res;
}

void HttpStorageClient::expectSuccess(const Response& res, const std::string& what) const {
    const int status = res.result_int();
    if (status < 200 || status >= 300) {
        throw StorageError(what + " answered " + std::to_string(status) + ": " + excerpt(res.body()), status);
    }
}

void HttpStorageClient::upload(const std::string& object_path, const std::string& bytes,
                               const std::string& content_type, const std::string& cache_control) {
    auto req = makeRequest(http::verb::post,
                           "/storage/v1/object/" + cfg_.bucket + "/" + encodePath(object_path),
                           content_type, bytes);
    req.set(http::field::cache_control, cache_control);
    req.set("x-upsert", "true");

    std::cout << "[Storage] Uploading " << bytes.size() << " bytes to " << cfg_.bucket << "/" << object_path << std::endl;
    expectSuccess(send(req), "upload");
}

std::string HttpStorageClient::createSignedUrl(const std::string& object_path, int expires_in_sec) {
    json body = {{"expiresIn", expires_in_sec}};
    auto req = makeRequest(http::verb::post,
                           "/storage/v1/object/sign/" + cfg_.bucket + "/" + encodePath(object_path),
                           "application/json", body.dump());
    auto res = send(req);
    expectSuccess(res, "sign");

    json answer = json::parse(res.body(), nullptr, false);
    std::string signed_path;
    if (answer.is_object()) {
        if (answer.contains("signedURL") && answer["signedURL"].is_string()) {
            signed_path = answer["signedURL"].get<std::string>();
        } else if (answer.contains("signedUrl") && answer["signedUrl"].is_string()) {
            signed_path = answer["signedUrl"].get<std::string>();
        }
    }
    if (signed_path.empty()) throw StorageError("sign answer carries no signed URL: " + excerpt(res.body()));

    if (signed_path.rfind("http://", 0) == 0 || signed_path.rfind("https://", 0) == 0) return signed_path;
    if (signed_path.front() != '/') signed_path.insert(signed_path.begin(), '/');
    std::string origin = (base_.use_ssl ? "https://" : "http://") + base_.hostHeader();
    return origin + base_.path + "/storage/v1" + signed_path;
}

void HttpStorageClient::updateRecord(const std::string& id, const json& fields) {
    auto req = makeRequest(http::verb::patch,
                           "/rest/v1/" + cfg_.table + "?id=eq." + encodePath(id),
                           "application/json", fields.dump());
    req.set("Prefer", "return=minimal");
    expectSuccess(send(req), "metadata update");
}

} // namespace page_recorder
