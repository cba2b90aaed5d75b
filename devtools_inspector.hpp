#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>

#include "clock.hpp"
#include "page_inspector.hpp"

namespace page_recorder {

// Reads render state out of the browser through its remote debugging
// endpoint (DevTools protocol over WebSocket).
class DevToolsInspector : public PageInspector {
public:
    using json = nlohmann::json;

    struct Config {
        std::string host = "127.0.0.1";
        uint16_t port = 9222;
        Millis timeout{5000};   // per network step
    };

    explicit DevToolsInspector(const Config& cfg);
    ~DevToolsInspector() override;

    void reset() override;
    std::optional<RenderStatus> inspect() override;

private:
    std::string findPageTarget();
    void connect(const std::string& target);
    json evaluate(const std::string& expression);
    void await(boost::beast::tcp_stream& stream, boost::beast::error_code& ec, Clock::duration limit);

    Config cfg_;
    boost::asio::io_context ioc_;
    std::unique_ptr<boost::beast::websocket::stream<boost::beast::tcp_stream>> ws_;
    int next_id_ = 1;
};

} // namespace page_recorder
