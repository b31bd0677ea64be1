#pragma once

#include "http/api_error.hpp"
#include "http/raw_request.hpp"
#include "http/response_codec.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

// One HTTP/1.1 exchange on an accepted socket. The head and the body are read
// separately so a handler can reject a request without consuming its upload.
class HttpConnection {
public:
    static constexpr size_t kMaxHeadBytes = 64 * 1024;

    HttpConnection(int fd, size_t max_body_bytes, uint32_t read_timeout_s);
    ~HttpConnection();

    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    int fd() const { return fd_; }

    // True once the peer went away or a read timed out; nothing more can be
    // exchanged and no error response should be attempted.
    bool broken() const { return broken_; }

    std::expected<RawRequest, ApiError> read_head();
    std::expected<void, ApiError> read_body(RawRequest& request);

    bool send(const HttpResponse& response);

    // Half-close, drain briefly so the peer can read the response, then close.
    void close();

private:
    bool recv_some();
    bool send_all(const std::string& data);

    int fd_;
    size_t max_body_bytes_;
    bool broken_ = false;
    std::string buf_;
};
