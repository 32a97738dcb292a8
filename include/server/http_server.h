#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

#include "server/product_api_handler.h"

namespace catalog {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @brief Async HTTP/REST API Server for the product catalog
 *
 * Features:
 * - Thread pool running one shared io_context
 * - POST/GET /api/produtos backed by ProductApiHandler
 * - /health and /stats operational endpoints
 * - JSON request/response format
 */
class HttpServer {
public:
    /**
     * @brief Server configuration
     */
    struct Config {
        std::string host = "0.0.0.0";
        uint16_t port = 8080;
        size_t num_threads = std::max<size_t>(1, std::thread::hardware_concurrency());
        size_t max_request_size_kb = 1024;
        uint32_t shutdown_grace_ms = 500; // time given to in-flight requests on stop()

        /**
         * @brief Overlay values from the "server" section of a config document.
         * Unknown keys are ignored.
         * @throws std::invalid_argument on out-of-range values
         */
        void applyJson(const nlohmann::json& server_section);
    };

    /**
     * @brief Construct HTTP server over an existing store
     * @param store Product store; must outlive the server
     */
    HttpServer(const Config& config, ProductStore& store);

    ~HttpServer();

    /**
     * @brief Start the server (non-blocking)
     */
    void start();

    /**
     * @brief Stop the server and wait for worker threads
     */
    void stop();

    bool isRunning() const { return running_; }

    // Actual bound port (useful when configured with port 0)
    uint16_t boundPort() const { return bound_port_; }

    // Route a request without a socket; used by sessions and tests
    http::response<http::string_body> routeRequest(const http::request<http::string_body>& req);

private:
    // Session class for handling individual connections
    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(tcp::socket socket, HttpServer* server);
        void start();

    private:
        void doRead();
        void onRead(beast::error_code ec, std::size_t bytes_transferred);
        void processRequest();
        void doWrite();
        void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);

        tcp::socket socket_;
        HttpServer* server_;
        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        http::request<http::string_body> request_;
        http::response<http::string_body> response_;
    };

    void doAccept();
    void onAccept(beast::error_code ec, tcp::socket socket);

    // Endpoint handlers
    http::response<http::string_body> handleHealthCheck(const http::request<http::string_body>& req);
    http::response<http::string_body> handleStats(const http::request<http::string_body>& req);
    http::response<http::string_body> handleProductsPost(const http::request<http::string_body>& req);
    http::response<http::string_body> handleProductsGet(const http::request<http::string_body>& req);

    // Utility methods
    http::response<http::string_body> makeResponse(
        http::status status,
        const std::string& body,
        const http::request<http::string_body>& req
    );

    http::response<http::string_body> makeErrorResponse(
        http::status status,
        const std::string& message,
        const http::request<http::string_body>& req,
        const std::vector<FieldError>& fields = {}
    );

    Config config_;
    ProductStore& store_;
    ProductApiHandler products_api_;

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    uint16_t bound_port_ = 0;

    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
    std::atomic<uint64_t> request_count_{0};
    std::atomic<uint64_t> error_count_{0};
    std::atomic<uint64_t> products_created_{0};
    std::atomic<uint64_t> validation_failures_{0};
};

} // namespace server
} // namespace catalog
