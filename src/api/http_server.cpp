#include "api/http_server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <exception>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/util/text.hpp"

namespace orch::api {

using core::errors::ErrorCategory;
using core::errors::OrchError;

namespace {

void set_socket_timeouts(const int fd, const int seconds) {
    timeval tv{};
    tv.tv_sec = seconds;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

std::size_t content_length(const std::string& head) {
    for (const auto& line : core::util::split(head, '\n')) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (core::util::lowercase(core::util::trim(line.substr(0, colon))) == "content-length") {
            const std::string value = core::util::trim(line.substr(colon + 1));
            try {
                return static_cast<std::size_t>(std::stoul(value));
            } catch (const std::exception&) {
                return 0;
            }
        }
    }
    return 0;
}

// Reads until the headers and Content-Length bytes of body have arrived.
std::optional<std::string> read_request(const int fd) {
    std::string data;
    char buffer[4096];
    std::size_t wanted = 0;
    bool have_head = false;
    while (true) {
        if (have_head && data.size() >= wanted) {
            return data;
        }
        const ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            return have_head ? std::optional<std::string>(data) : std::nullopt;
        }
        data.append(buffer, static_cast<std::size_t>(n));
        if (data.size() > kMaxRequestBytes) {
            return std::nullopt;
        }
        if (!have_head) {
            const auto end = data.find("\r\n\r\n");
            if (end != std::string::npos) {
                have_head = true;
                wanted = end + 4 + content_length(data.substr(0, end));
            }
        }
    }
}

void send_all(const int fd, const std::string& payload) {
    std::size_t sent = 0;
    while (sent < payload.size()) {
        const ssize_t n = ::send(fd, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            return;
        }
        sent += static_cast<std::size_t>(n);
    }
}

}  // namespace

std::optional<ApiRequest> parse_http_request(const std::string& raw) {
    const auto head_end = raw.find("\r\n\r\n");
    if (head_end == std::string::npos) {
        return std::nullopt;
    }
    const std::string head = raw.substr(0, head_end);
    std::istringstream request_line(head.substr(0, head.find("\r\n")));
    ApiRequest request;
    std::string version;
    request_line >> request.method >> request.path >> version;
    if (request.method.empty() || request.path.empty() || version.rfind("HTTP/", 0) != 0) {
        return std::nullopt;
    }
    request.body = raw.substr(head_end + 4, content_length(head));
    return request;
}

const char* reason_phrase(const int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 409: return "Conflict";
        case 412: return "Precondition Failed";
        case 413: return "Payload Too Large";
        default: return status >= 500 ? "Internal Server Error" : "Unknown";
    }
}

std::string render_http_response(const ApiResponse& response) {
    const std::string body = response.body.dump();
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << " " << reason_phrase(response.status) << "\r\n"
        << "Content-Type: application/json\r\n"
        << "Access-Control-Allow-Origin: *\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << body;
    return out.str();
}

HttpServer::HttpServer(const ApiRouter& router, std::string host, const std::uint16_t port)
    : router_(router), host_(std::move(host)), port_(port) {}

HttpServer::~HttpServer() {
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
    }
}

core::errors::Status HttpServer::bind_and_listen() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        return OrchError{ErrorCategory::External,
                         std::string("socket failed: ") + std::strerror(errno), "api_bind_failed"};
    }
    int one = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) <= 0) {
        return OrchError{ErrorCategory::Input, "Invalid listen address: " + host_,
                         "api_bind_failed"};
    }
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return OrchError{ErrorCategory::External,
                         "Unable to bind " + host_ + ":" + std::to_string(port_) + ": " +
                             std::strerror(errno),
                         "api_bind_failed", "Choose another port with --port"};
    }
    if (::listen(listen_fd_, 64) < 0) {
        return OrchError{ErrorCategory::External,
                         std::string("listen failed: ") + std::strerror(errno), "api_bind_failed"};
    }
    if (port_ == 0) {
        socklen_t len = sizeof(addr);
        if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
            port_ = ntohs(addr.sin_port);
        }
    }
    LOG_INFO("REST API listening on http://" + host_ + ":" + std::to_string(port_));
    return core::errors::ok();
}

void HttpServer::serve(const std::atomic_bool& stop) {
    while (!stop.load()) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, 200);
        if (ready <= 0) {
            continue;
        }
        sockaddr_in client{};
        socklen_t len = sizeof(client);
        const int fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&client), &len);
        if (fd < 0) {
            continue;
        }
        set_socket_timeouts(fd, 10);
        handle_connection(fd);
        ::close(fd);
    }
    LOG_INFO("REST API stopped");
}

void HttpServer::handle_connection(const int fd) const {
    const auto raw = read_request(fd);
    if (!raw) {
        ApiResponse too_large;
        too_large.status = 413;
        too_large.body = {{"error", "request_rejected"},
                          {"message", "Request was empty, truncated or too large"}};
        send_all(fd, render_http_response(too_large));
        return;
    }
    const auto request = parse_http_request(*raw);
    if (!request) {
        send_all(fd, render_http_response(error_response(OrchError{
                         ErrorCategory::Input, "Malformed HTTP request", "bad_request"})));
        return;
    }
    ApiResponse response;
    try {
        response = router_.handle(*request);
    } catch (const std::exception& e) {
        LOG_ERROR("API " + request->method + " " + request->path + " failed: " + e.what());
        response = error_response(OrchError{ErrorCategory::Internal, e.what(), "internal_error"});
    }
    LOG_DEBUG("API " + request->method + " " + request->path + " -> " +
              std::to_string(response.status));
    send_all(fd, render_http_response(response));
}

}  // namespace orch::api
