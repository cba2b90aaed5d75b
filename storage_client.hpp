#pragma once

#include <boost/asio/ssl.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <map>
#include <string>

#include "clock.hpp"
#include "url.hpp"

namespace page_recorder {

// The three storage operations the recorder needs.
class StorageClient {
public:
    virtual ~StorageClient() = default;

    virtual void upload(const std::string& object_path, const std::string& bytes,
                        const std::string& content_type, const std::string& cache_control) = 0;
    virtual std::string createSignedUrl(const std::string& object_path, int expires_in_sec) = 0;
    virtual void updateRecord(const std::string& id, const nlohmann::json& fields) = 0;
};

// REST client for an object store + metadata table behind one endpoint
// (storage API under /storage/v1, table API under /rest/v1).
// Every failure is raised as StorageError.
class HttpStorageClient : public StorageClient {
public:
    struct Config {
        std::string endpoint;        // e.g. https://project.example.co
        std::string service_key;
        std::string bucket = "videos";
        std::string table = "videos";
        Millis timeout{120000};      // whole request/response exchange
    };

    explicit HttpStorageClient(const Config& cfg);

    // Endpoint and key both present.
    static bool isConfigured(const Config& cfg);

    void upload(const std::string& object_path, const std::string& bytes,
                const std::string& content_type, const std::string& cache_control) override;
    std::string createSignedUrl(const std::string& object_path, int expires_in_sec) override;
    void updateRecord(const std::string& id, const nlohmann::json& fields) override;

private:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    Request makeRequest(boost::beast::http::verb verb, const std::string& path,
                        const std::string& content_type, std::string body) const;
    Response send(Request& req);
    void expectSuccess(const Response& res, const std::string& what) const;

    Config cfg_;
    ParsedUrl base_;
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tls_client};
};

} // namespace page_recorder
