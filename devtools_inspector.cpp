#include "devtools_inspector.hpp"

#include <boost/beast/http.hpp>

#include <iostream>

#include "net_deadline.hpp"
#include "url.hpp"

namespace page_recorder {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

DevToolsInspector::DevToolsInspector(const Config& cfg) : cfg_(cfg) {}

DevToolsInspector::~DevToolsInspector() { reset(); }

void DevToolsInspector::reset() {
    if (ws_) {
        beast::error_code ignore;
        beast::get_lowest_layer(*ws_).socket().close(ignore);
        ws_.reset();
    }
    ioc_.restart();
}

void DevToolsInspector::await(beast::tcp_stream& stream, beast::error_code& ec, Clock::duration limit) {
    runWithDeadline(ioc_, ec, limit, [&stream]() {
        beast::error_code ignore;
        stream.socket().close(ignore);
    });
}

std::string DevToolsInspector::findPageTarget() {
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(cfg_.host, std::to_string(cfg_.port));

    beast::tcp_stream stream(ioc_);
    beast::error_code ec = net::error::would_block;
    stream.async_connect(results, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
    await(stream, ec, cfg_.timeout);

    http::request<http::empty_body> req{http::verb::get, "/json/list", 11};
    req.set(http::field::host, cfg_.host + ":" + std::to_string(cfg_.port));
    req.set(http::field::user_agent, "Page-Recorder/1.0");

    ec = net::error::would_block;
    http::async_write(stream, req, [&](beast::error_code e, std::size_t) { ec = e; });
    await(stream, ec, cfg_.timeout);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    ec = net::error::would_block;
    http::async_read(stream, buffer, res, [&](beast::error_code e, std::size_t) { ec = e; });
    await(stream, ec, cfg_.timeout);

    beast::error_code ignore;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignore);

    if (res.result() != http::status::ok) {
        throw std::runtime_error("DevTools target list answered " + std::to_string(res.result_int()));
    }

    json targets = json::parse(res.body());
    for (const auto& t : targets) {
        if (t.value("type", "") == "page" && t.contains("webSocketDebuggerUrl")) {
            return t["webSocketDebuggerUrl"].get<std::string>();
        }
    }
    throw std::runtime_error("no page target exposed yet");
}

void DevToolsInspector::connect(const std::string& target) {
    ParsedUrl url = parseUrl(target);

    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(url.host, std::to_string(url.port));

    ws_ = std::make_unique<websocket::stream<beast::tcp_stream>>(ioc_);
    auto& socket = beast::get_lowest_layer(*ws_);

    beast::error_code ec = net::error::would_block;
    socket.async_connect(results, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
    await(socket, ec, cfg_.timeout);

    // Set a decorator to change the User-Agent of the handshake
    ws_->set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(http::field::user_agent, "Page-Recorder/1.0");
        }));

    ec = net::error::would_block;
    ws_->async_handshake(url.host + ":" + std::to_string(url.port), url.path,
                         [&](beast::error_code e) { ec = e; });
    await(socket, ec, cfg_.timeout);

    std::cout << "[DevTools] Connected to " << url.path << std::endl;
}

json DevToolsInspector::evaluate(const std::string& expression) {
    const int id = next_id_++;
    json call = {
        {"id", id},
        {"method", "Runtime.evaluate"},
        {"params", {{"expression", expression}, {"returnByValue", true}}}
    };
    std::string payload = call.dump();
    auto& socket = beast::get_lowest_layer(*ws_);

    beast::error_code ec = net::error::would_block;
    ws_->text(true);
    ws_->async_write(net::buffer(payload), [&](beast::error_code e, std::size_t) { ec = e; });
    await(socket, ec, cfg_.timeout);

    // Skip protocol events until our reply arrives, within one overall deadline.
    const auto deadline = Clock::now() + cfg_.timeout;
    while (true) {
        auto remaining = deadline - Clock::now();
        if (remaining <= Clock::duration::zero()) throw beast::system_error(net::error::timed_out);

        beast::flat_buffer buffer;
        ec = net::error::would_block;
        ws_->async_read(buffer, [&](beast::error_code e, std::size_t) { ec = e; });
        await(socket, ec, remaining);

        json reply = json::parse(beast::buffers_to_string(buffer.data()), nullptr, false);
        if (!reply.is_object() || reply.value("id", -1) != id) continue;

        if (reply.contains("error")) {
            throw std::runtime_error("Runtime.evaluate failed: " + reply["error"].dump());
        }
        const json& result = reply.at("result");
        if (result.contains("exceptionDetails")) {
            throw std::runtime_error("page threw: " + result["exceptionDetails"].value("text", std::string("?")));
        }
        return result.at("result").at("value");
    }
}

std::optional<RenderStatus> DevToolsInspector::inspect() {
    try {
        if (!ws_) connect(findPageTarget());
        return renderStatusFromJson(evaluate(renderStatusExpression()));
    } catch (const beast::system_error& se) {
        std::cerr << "[DevTools] " << se.code().message() << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "[DevTools] Bad reply: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[DevTools] " << e.what() << std::endl;
    }
    reset();
    return std::nullopt;
}

} // namespace page_recorder
