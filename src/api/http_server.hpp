#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "api/api_router.hpp"
#include "core/errors/orch_errors.hpp"

namespace orch::api {

inline constexpr std::size_t kMaxRequestBytes = 1024 * 1024;

// Parses "METHOD /path HTTP/1.1" plus headers; the body is whatever follows
// the blank line, cut to Content-Length.
std::optional<ApiRequest> parse_http_request(const std::string& raw);
std::string render_http_response(const ApiResponse& response);
const char* reason_phrase(int status);

// Minimal HTTP/1.1 listener in front of ApiRouter; one request per connection.
class HttpServer {
public:
    HttpServer(const ApiRouter& router, std::string host, std::uint16_t port);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    core::errors::Status bind_and_listen();
    // Accepts connections until stop is set; checks the flag every 200ms.
    void serve(const std::atomic_bool& stop);

    std::uint16_t port() const { return port_; }

private:
    void handle_connection(int fd) const;

    const ApiRouter& router_;
    std::string host_;
    std::uint16_t port_;
    int listen_fd_ = -1;
};

}  // namespace orch::api
