#include "server/http_server.h"
#include "storage/product_store.h"
#include "utils/logger.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

using json = nlohmann::json;

namespace catalog {
namespace server {

// ============================================================================
// Config
// ============================================================================

void HttpServer::Config::applyJson(const json& sv) {
    if (!sv.is_object()) return;
    if (sv.contains("host")) host = sv["host"].get<std::string>();
    if (sv.contains("port")) {
        int p = sv["port"].get<int>();
        if (p < 0 || p > 65535) {
            throw std::invalid_argument("server.port must be in range 0-65535");
        }
        port = static_cast<uint16_t>(p);
    }
    if (sv.contains("worker_threads")) {
        auto n = sv["worker_threads"].get<int64_t>();
        // 0 keeps the hardware-concurrency default
        if (n < 0) throw std::invalid_argument("server.worker_threads must not be negative");
        if (n > 0) num_threads = static_cast<size_t>(n);
    }
    if (sv.contains("max_request_size_kb")) {
        auto kb = sv["max_request_size_kb"].get<int64_t>();
        if (kb <= 0) throw std::invalid_argument("server.max_request_size_kb must be positive");
        max_request_size_kb = static_cast<size_t>(kb);
    }
    if (sv.contains("shutdown_grace_ms")) {
        auto ms = sv["shutdown_grace_ms"].get<int64_t>();
        if (ms < 0 || ms > 60000) {
            throw std::invalid_argument("server.shutdown_grace_ms must be in range 0-60000");
        }
        shutdown_grace_ms = static_cast<uint32_t>(ms);
    }
}

// ============================================================================
// HttpServer Implementation
// ============================================================================

HttpServer::HttpServer(const Config& config, ProductStore& store)
    : config_(config)
    , store_(store)
    , products_api_(store)
    , acceptor_(ioc_)
{
    if (config_.num_threads == 0) config_.num_threads = 1;
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_) {
        CATALOG_WARN("Server already running");
        return;
    }

    // Setup acceptor
    tcp::endpoint endpoint{net::ip::make_address(config_.host), config_.port};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();

    CATALOG_INFO("HTTP Server listening on {}:{}", config_.host, bound_port_);

    running_ = true;
    start_time_ = std::chrono::steady_clock::now();

    // Start accepting connections
    doAccept();

    // Start thread pool
    threads_.reserve(config_.num_threads);
    for (size_t i = 0; i < config_.num_threads; ++i) {
        threads_.emplace_back([this, i] {
            CATALOG_DEBUG("Worker thread {} started", i);
            ioc_.run();
            CATALOG_DEBUG("Worker thread {} stopped", i);
        });
    }

    CATALOG_INFO("HTTP Server started with {} worker thread(s)", config_.num_threads);
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    CATALOG_INFO("Stopping HTTP Server...");

    // Stop accepting new connections; the acceptor is only touched from the io_context
    net::post(ioc_, [this] {
        beast::error_code ec;
        acceptor_.close(ec);
    });

    if (config_.shutdown_grace_ms > 0) {
        CATALOG_INFO("Waiting {} ms for active requests to complete...", config_.shutdown_grace_ms);
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.shutdown_grace_ms));
    }

    ioc_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    CATALOG_INFO("HTTP Server stopped ({} requests served, {} errors)",
        request_count_.load(std::memory_order_relaxed),
        error_count_.load(std::memory_order_relaxed));
}

void HttpServer::doAccept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&HttpServer::onAccept, this)
    );
}

void HttpServer::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted) return;
        CATALOG_ERROR("Accept error: {}", ec.message());
    } else {
        std::make_shared<Session>(std::move(socket), this)->start();
    }

    // Accept next connection
    if (running_) {
        doAccept();
    }
}

namespace {
    enum class Route {
        Health,
        Stats,
        ProductsPost,
        ProductsGet,
        ProductsMethodNotAllowed,
        NotFound
    };

    constexpr const char* PRODUCTS_PATH = "/api/produtos";

    Route classifyRoute(const http::request<http::string_body>& req) {
        const auto method = req.method();
        // Strip query string; it never influences routing
        std::string path = std::string(req.target());
        auto qpos = path.find('?');
        if (qpos != std::string::npos) path = path.substr(0, qpos);
        if (path.size() > 1 && path.back() == '/') path.pop_back();

        if ((path == "/" || path == "/health") && method == http::verb::get) return Route::Health;
        if (path == "/stats" && method == http::verb::get) return Route::Stats;

        if (path == PRODUCTS_PATH) {
            if (method == http::verb::post) return Route::ProductsPost;
            if (method == http::verb::get) return Route::ProductsGet;
            return Route::ProductsMethodNotAllowed;
        }

        return Route::NotFound;
    }

    std::string toLower(std::string s) {
        for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
        return s;
    }
}

http::response<http::string_body> HttpServer::routeRequest(
    const http::request<http::string_body>& req
) {
    CATALOG_DEBUG("Request: {} {}", std::string(http::to_string(req.method())), std::string(req.target()));

    request_count_.fetch_add(1, std::memory_order_relaxed);

    if (req.body().size() > config_.max_request_size_kb * 1024) {
        return makeErrorResponse(http::status::payload_too_large, "Request body too large", req);
    }

    http::response<http::string_body> response;

    try {
        switch (classifyRoute(req)) {
            case Route::Health:
                response = handleHealthCheck(req);
                break;
            case Route::Stats:
                response = handleStats(req);
                break;
            case Route::ProductsPost:
                response = handleProductsPost(req);
                break;
            case Route::ProductsGet:
                response = handleProductsGet(req);
                break;
            case Route::ProductsMethodNotAllowed:
                response = makeErrorResponse(http::status::method_not_allowed, "Method not allowed", req);
                response.set(http::field::allow, "GET, POST");
                break;
            case Route::NotFound:
            default:
                response = makeErrorResponse(http::status::not_found, "Endpoint not found", req);
                break;
        }
    } catch (const std::exception& e) {
        CATALOG_ERROR("Unhandled error routing {}: {}", std::string(req.target()), e.what());
        response = makeErrorResponse(http::status::internal_server_error, "Internal server error", req);
    }

    return response;
}

// -----------------------------------------------------------------------------
// Operational endpoints
// -----------------------------------------------------------------------------

http::response<http::string_body> HttpServer::handleHealthCheck(
    const http::request<http::string_body>& req
) {
    auto uptime_seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_
    ).count();

    json response = {
        {"status", "healthy"},
        {"version", "0.1.0"},
        {"service", "catalog"},
        {"uptime_seconds", uptime_seconds}
    };
    return makeResponse(http::status::ok, response.dump(), req);
}

http::response<http::string_body> HttpServer::handleStats(
    const http::request<http::string_body>& req
) {
    auto uptime_seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_
    ).count();

    json response = {
        {"server", {
            {"uptime_seconds", uptime_seconds},
            {"total_requests", request_count_.load(std::memory_order_relaxed)},
            {"total_errors", error_count_.load(std::memory_order_relaxed)},
            {"worker_threads", config_.num_threads}
        }},
        {"products", {
            {"count", store_.size()},
            {"next_id", store_.nextId()},
            {"created", products_created_.load(std::memory_order_relaxed)},
            {"validation_failures", validation_failures_.load(std::memory_order_relaxed)}
        }}
    };
    return makeResponse(http::status::ok, response.dump(), req);
}

// -----------------------------------------------------------------------------
// Products API
// -----------------------------------------------------------------------------

http::response<http::string_body> HttpServer::handleProductsPost(
    const http::request<http::string_body>& req
) {
    auto ct = req.find(http::field::content_type);
    if (ct != req.end() && toLower(std::string(ct->value())).find("application/json") == std::string::npos) {
        return makeErrorResponse(http::status::unsupported_media_type,
            "Content-Type must be application/json", req);
    }
    if (req.body().empty()) {
        return makeErrorResponse(http::status::bad_request, "Missing JSON body", req);
    }

    json body;
    try {
        body = json::parse(req.body());
    } catch (const json::parse_error& e) {
        // e.what() echoes raw input bytes, which may not be valid UTF-8
        return makeErrorResponse(http::status::bad_request,
            "Invalid JSON at byte " + std::to_string(e.byte), req);
    }
    if (!body.is_object()) {
        return makeErrorResponse(http::status::bad_request, "Request body must be a JSON object", req);
    }

    try {
        auto result = products_api_.handleCreate(ProductDraft::fromJson(body));
        if (!result.ok()) {
            validation_failures_.fetch_add(1, std::memory_order_relaxed);
            return makeErrorResponse(http::status::bad_request, "Validation failed", req, result.errors);
        }
        products_created_.fetch_add(1, std::memory_order_relaxed);
        return makeResponse(http::status::created, result.product.toJson().dump(), req);
    } catch (const InvalidStateError& e) {
        CATALOG_ERROR("Product store rejected insert: {}", e.what());
        return makeErrorResponse(http::status::internal_server_error, e.what(), req);
    } catch (const std::exception& e) {
        CATALOG_ERROR("Unexpected error creating product: {}", e.what());
        return makeErrorResponse(http::status::internal_server_error, e.what(), req);
    }
}

http::response<http::string_body> HttpServer::handleProductsGet(
    const http::request<http::string_body>& req
) {
    try {
        auto products = products_api_.handleList();
        return makeResponse(http::status::ok, Product::toJsonArray(products).dump(), req);
    } catch (const std::exception& e) {
        CATALOG_ERROR("Unexpected error listing products: {}", e.what());
        return makeErrorResponse(http::status::internal_server_error, e.what(), req);
    }
}

http::response<http::string_body> HttpServer::makeResponse(
    http::status status,
    const std::string& body,
    const http::request<http::string_body>& req
) {
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::server, "catalog/0.1.0");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HttpServer::makeErrorResponse(
    http::status status,
    const std::string& message,
    const http::request<http::string_body>& req,
    const std::vector<FieldError>& fields
) {
    error_count_.fetch_add(1, std::memory_order_relaxed);

    json error_body = {
        {"error", true},
        {"message", message},
        {"status_code", static_cast<int>(status)}
    };
    if (!fields.empty()) {
        json arr = json::array();
        for (const auto& f : fields) arr.push_back(f.toJson());
        error_body["fields"] = std::move(arr);
    }
    return makeResponse(status, error_body.dump(-1, ' ', false, json::error_handler_t::replace), req);
}

// ============================================================================
// Session Implementation
// ============================================================================

HttpServer::Session::Session(tcp::socket socket, HttpServer* server)
    : socket_(std::move(socket))
    , server_(server)
{
}

void HttpServer::Session::start() {
    doRead();
}

void HttpServer::Session::doRead() {
    parser_.emplace();
    parser_->body_limit(server_->config_.max_request_size_kb * 1024);

    http::async_read(
        socket_,
        buffer_,
        *parser_,
        beast::bind_front_handler(&Session::onRead, shared_from_this())
    );
}

void HttpServer::Session::onRead(
    beast::error_code ec,
    std::size_t bytes_transferred
) {
    boost::ignore_unused(bytes_transferred);

    if (ec == http::error::end_of_stream) {
        // Client closed connection
        socket_.shutdown(tcp::socket::shutdown_send, ec);
        return;
    }

    if (ec == http::error::body_limit) {
        http::request<http::string_body> head{parser_->get().method(), parser_->get().target(), parser_->get().version()};
        head.keep_alive(false);
        response_ = server_->makeErrorResponse(http::status::payload_too_large, "Request body too large", head);
        doWrite();
        return;
    }

    if (ec) {
        if (ec != net::error::operation_aborted) {
            CATALOG_ERROR("Read error: {}", ec.message());
        }
        return;
    }

    request_ = parser_->release();
    processRequest();
}

void HttpServer::Session::processRequest() {
    response_ = server_->routeRequest(request_);
    doWrite();
}

void HttpServer::Session::doWrite() {
    bool close = response_.need_eof();
    http::async_write(
        socket_,
        response_,
        beast::bind_front_handler(
            &Session::onWrite,
            shared_from_this(),
            close
        )
    );
}

void HttpServer::Session::onWrite(
    bool close,
    beast::error_code ec,
    std::size_t bytes_transferred
) {
    boost::ignore_unused(bytes_transferred);

    if (ec) {
        CATALOG_ERROR("Write error: {}", ec.message());
        return;
    }

    if (close) {
        socket_.shutdown(tcp::socket::shutdown_send, ec);
        return;
    }

    doRead();
}

} // namespace server
} // namespace catalog
