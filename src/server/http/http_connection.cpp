#include "http/http_connection.hpp"

#include "http/text_util.hpp"

#include <cerrno>
#include <charconv>
#include <chrono>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <vector>

namespace {

constexpr std::string_view kHeadEnd = "\r\n\r\n";
constexpr int kDrainTimeoutMs = 500;
constexpr size_t kDrainMaxBytes = 1024 * 1024;

std::vector<std::string_view> split_lines(std::string_view s) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= s.size()) {
        auto pos = s.find("\r\n", start);
        if (pos == std::string_view::npos) {
            lines.push_back(s.substr(start));
            break;
        }
        lines.push_back(s.substr(start, pos - start));
        start = pos + 2;
    }
    return lines;
}

bool parse_request_line(std::string_view line, RawRequest& req) {
    auto sp1 = line.find(' ');
    if (sp1 == std::string_view::npos || sp1 == 0) return false;
    auto sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos || sp2 == sp1 + 1) return false;

    req.method = line.substr(0, sp1);
    req.path = line.substr(sp1 + 1, sp2 - sp1 - 1);
    req.version = line.substr(sp2 + 1);
    return req.version.starts_with("HTTP/") && req.version.find(' ') == std::string::npos;
}

} // namespace

HttpConnection::HttpConnection(int fd, size_t max_body_bytes, uint32_t read_timeout_s)
    : fd_(fd), max_body_bytes_(max_body_bytes) {
    if (read_timeout_s > 0) {
        timeval tv{.tv_sec = static_cast<time_t>(read_timeout_s), .tv_usec = 0};
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }
}

HttpConnection::~HttpConnection() {
    if (fd_ >= 0) ::close(fd_);
}

bool HttpConnection::recv_some() {
    char tmp[16 * 1024];
    while (true) {
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n > 0) {
            buf_.append(tmp, static_cast<size_t>(n));
            return true;
        }
        if (n < 0 && errno == EINTR) continue;
        // EOF, receive timeout (EAGAIN) or a reset
        broken_ = true;
        return false;
    }
}

std::expected<RawRequest, ApiError> HttpConnection::read_head() {
    size_t end;
    while ((end = buf_.find(kHeadEnd)) == std::string::npos) {
        if (buf_.size() > kMaxHeadBytes) {
            return std::unexpected(ApiError::invalid_request("Request header too large"));
        }
        if (!recv_some()) {
            return std::unexpected(ApiError::invalid_request("Connection closed before request was complete"));
        }
    }

    std::string head = buf_.substr(0, end);
    buf_.erase(0, end + kHeadEnd.size());

    auto lines = split_lines(head);
    RawRequest req;
    if (lines.empty() || !parse_request_line(lines[0], req)) {
        return std::unexpected(ApiError::invalid_request("Malformed request line"));
    }

    for (size_t i = 1; i < lines.size(); ++i) {
        auto line = lines[i];
        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0 ||
            line.substr(0, colon).find_first_of(" \t") != std::string_view::npos) {
            return std::unexpected(ApiError::invalid_request("Malformed header line"));
        }
        req.set_header(line.substr(0, colon), std::string(text::trim(line.substr(colon + 1))));
    }

    return req;
}

std::expected<void, ApiError> HttpConnection::read_body(RawRequest& request) {
    auto te = RawRequest::lower(request.header("Transfer-Encoding"));
    if (!te.empty() && te != "identity") {
        return std::unexpected(ApiError::invalid_request("Chunked transfer encoding is not supported"));
    }

    size_t length = 0;
    if (request.has_header("Content-Length")) {
        auto value = request.header("Content-Length");
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
        if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
            return std::unexpected(ApiError::invalid_request("Invalid Content-Length"));
        }
    }

    if (length > max_body_bytes_) {
        return std::unexpected(ApiError::payload_too_large("Request body too large"));
    }

    if (RawRequest::lower(request.header("Expect")) == "100-continue" && buf_.size() < length) {
        if (!send_all("HTTP/1.1 100 Continue\r\n\r\n")) {
            broken_ = true;
            return std::unexpected(ApiError::invalid_request("Connection closed"));
        }
    }

    while (buf_.size() < length) {
        if (!recv_some()) {
            return std::unexpected(ApiError::invalid_request("Incomplete request body"));
        }
    }

    request.body = buf_.substr(0, length);
    buf_.erase(0, length);
    return {};
}

bool HttpConnection::send(const HttpResponse& response) {
    return send_all(response_codec::serialize(response));
}

bool HttpConnection::send_all(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void HttpConnection::close() {
    if (fd_ < 0) return;

    ::shutdown(fd_, SHUT_WR);

    // Unread request bytes would make the kernel answer with RST and the peer
    // could lose the response, so swallow what is still in flight.
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kDrainTimeoutMs);
    size_t drained = 0;
    char tmp[16 * 1024];
    while (drained < kDrainMaxBytes) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) break;

        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(left));
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) break;

        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), MSG_DONTWAIT);
        if (n <= 0) break;
        drained += static_cast<size_t>(n);
    }

    ::close(fd_);
    fd_ = -1;
}
