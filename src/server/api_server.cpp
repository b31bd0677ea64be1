#include "api_server.hpp"

#include "http/response_codec.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <exception>
#include <format>
#include <netdb.h>
#include <poll.h>
#include <print>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace {

constexpr int kListenBacklog = 128;
constexpr int kReapIntervalMs = 1000;
constexpr auto kAcceptBackoff = std::chrono::milliseconds(100);

// Out of descriptors or kernel memory: the pending connection stays queued,
// so polling the listener again right away would spin.
bool accept_exhausted(int err) {
    return err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM;
}

} // namespace

ApiServer::ApiServer(Config config, std::shared_ptr<TranscriptionEngine> engine,
                     AudioDecoder& decoder, LogSink log)
    : config_(std::move(config)), log_(std::move(log)),
      gateway_(std::move(engine)),
      dispatcher_(config_.model, gateway_, decoder, log_) {}

ApiServer::~ApiServer() {
    stop();
}

bool ApiServer::start(const std::string& host, uint16_t port) {
    std::lock_guard lock(lifecycle_mutex_);
    if (state() == ServerState::Running) return true;

    state_.store(ServerState::Starting, std::memory_order_release);

    if (!open_listener(host, port)) {
        state_.store(ServerState::Stopped, std::memory_order_release);
        return false;
    }

    wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        std::println(stderr, "http: eventfd failed: {}", std::strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        state_.store(ServerState::Stopped, std::memory_order_release);
        return false;
    }

    state_.store(ServerState::Running, std::memory_order_release);
    accept_thread_ = std::jthread([this] { accept_loop(); });

    log(std::format("API server started at http://{}:{}", host, port_));
    return true;
}

void ApiServer::stop() {
    std::lock_guard lock(lifecycle_mutex_);
    if (state() != ServerState::Running) return;

    state_.store(ServerState::Stopping, std::memory_order_release);

    uint64_t val = 1;
    if (::write(wake_fd_, &val, sizeof(val)) < 0) {
        std::println(stderr, "http: eventfd write failed: {}", std::strerror(errno));
    }
    if (accept_thread_.joinable()) accept_thread_.join();

    ::close(listen_fd_);
    listen_fd_ = -1;
    ::close(wake_fd_);
    wake_fd_ = -1;

    // Blocked reads return EOF; a worker inside the engine call still gets to
    // write its response.
    std::unordered_map<uint64_t, Worker> workers;
    {
        std::lock_guard wl(workers_mutex_);
        for (auto& [id, w] : workers_) {
            if (w.fd >= 0) ::shutdown(w.fd, SHUT_RD);
        }
        workers.swap(workers_);
        finished_.clear();
    }
    for (auto& [id, w] : workers) {
        if (w.thread.joinable()) w.thread.join();
    }

    port_ = 0;
    state_.store(ServerState::Stopped, std::memory_order_release);
    log("API server stopped");
}

bool ApiServer::open_listener(const std::string& host, uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    addrinfo* res = nullptr;
    auto port_str = std::to_string(port);
    int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0) {
        std::println(stderr, "http: cannot resolve {}: {}", host, gai_strerror(rc));
        return false;
    }

    std::string last_error = "no usable address";
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }

        int one = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) < 0 || ::listen(fd, kListenBacklog) < 0) {
            last_error = std::strerror(errno);
            ::close(fd);
            continue;
        }

        sockaddr_storage addr{};
        socklen_t len = sizeof(addr);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
            if (addr.ss_family == AF_INET) {
                port_ = ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
            } else if (addr.ss_family == AF_INET6) {
                port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
            }
        }

        listen_fd_ = fd;
        ::freeaddrinfo(res);
        return true;
    }

    ::freeaddrinfo(res);
    std::println(stderr, "http: failed to start API server on {}:{}: {}", host, port, last_error);
    return false;
}

void ApiServer::accept_loop() {
    std::chrono::steady_clock::time_point paused_until{};
    while (true) {
        auto now = std::chrono::steady_clock::now();
        bool paused = now < paused_until;
        int timeout = kReapIntervalMs;
        if (paused) {
            auto left = std::chrono::ceil<std::chrono::milliseconds>(paused_until - now).count();
            timeout = static_cast<int>(std::min<int64_t>(left, kReapIntervalMs));
        }

        // A negative fd is ignored by poll.
        pollfd fds[2] = {
            {.fd = paused ? -1 : listen_fd_, .events = POLLIN, .revents = 0},
            {.fd = wake_fd_, .events = POLLIN, .revents = 0},
        };
        int n = ::poll(fds, 2, timeout);
        reap_finished();

        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "http: poll failed: {}", std::strerror(errno));
            break;
        }
        if (fds[1].revents & POLLIN) break;

        if (fds[0].revents & POLLIN) {
            int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (fd < 0) {
                int err = errno;
                if (accept_exhausted(err)) {
                    std::println(stderr, "http: accept failed: {}, pausing accepts", std::strerror(err));
                    paused_until = std::chrono::steady_clock::now() + kAcceptBackoff;
                } else if (err != EINTR && err != EAGAIN && err != ECONNABORTED) {
                    std::println(stderr, "http: accept failed: {}", std::strerror(err));
                }
                continue;
            }
            spawn_worker(fd);
        }
    }
}

std::jthread ApiServer::launch_worker(std::function<void()> body) {
    return std::jthread(std::move(body));
}

void ApiServer::spawn_worker(int fd) {
    {
        std::lock_guard lock(workers_mutex_);
        uint64_t id = next_worker_id_++;
        auto& worker = workers_[id];
        worker.fd = fd;
        try {
            // The worker's final bookkeeping takes workers_mutex_, so it cannot
            // run before this entry is complete.
            worker.thread = launch_worker([this, id, fd] {
                serve_connection(id, fd);
                std::lock_guard l(workers_mutex_);
                finished_.push_back(id);
            });
            return;
        } catch (const std::system_error& e) {
            std::println(stderr, "http: cannot start connection worker: {}", e.what());
            workers_.erase(id);
        }
    }
    reject_connection(fd, ApiError::service_unavailable("Server is busy, try again later"));
}

void ApiServer::reject_connection(int fd, const ApiError& error) {
    // Best effort from the accept thread: never block on a slow peer.
    auto data = response_codec::serialize(response_codec::error(error));
    if (::send(fd, data.data(), data.size(), MSG_NOSIGNAL | MSG_DONTWAIT) < 0) {
        std::println(stderr, "http: could not send rejection: {}", std::strerror(errno));
    }
    ::shutdown(fd, SHUT_WR);

    // Discard request bytes already queued so close() does not reset the
    // connection ahead of the response.
    char tmp[4096];
    for (int i = 0; i < 16 && ::recv(fd, tmp, sizeof(tmp), MSG_DONTWAIT) > 0; ++i) {
    }
    ::close(fd);
    log(std::format("API: connection rejected {}", error.http_status));
}

void ApiServer::serve_connection(uint64_t id, int fd) {
    HttpConnection conn(fd, config_.server.max_body_bytes, config_.server.read_timeout_s);
    try {
        handle_connection(conn);
    } catch (const std::exception& e) {
        std::println(stderr, "http: connection error: {}", e.what());
    }
    release_fd(id);
    conn.close();
}

void ApiServer::handle_connection(HttpConnection& conn) {
    auto head = conn.read_head();
    if (!head) {
        if (conn.broken()) return;
        auto response = response_codec::error(head.error());
        if (!conn.send(response)) {
            log("API: failed to send response to malformed request");
            return;
        }
        log(std::format("API: malformed request {}", response.status));
        return;
    }

    auto response = dispatcher_.handle(*head, [&conn](RawRequest& r) { return conn.read_body(r); });

    if (conn.broken()) {
        log(std::format("API: \"{} {}\" connection dropped", head->method, head->path));
        return;
    }
    if (!conn.send(response)) {
        log(std::format("API: \"{} {}\" failed to send response", head->method, head->path));
        return;
    }
    log(std::format("API: \"{} {}\" {}", head->method, head->path, response.status));
}

void ApiServer::release_fd(uint64_t id) {
    std::lock_guard lock(workers_mutex_);
    if (auto it = workers_.find(id); it != workers_.end()) {
        it->second.fd = -1;
    }
}

void ApiServer::reap_finished() {
    std::vector<std::jthread> done;
    {
        std::lock_guard lock(workers_mutex_);
        for (uint64_t id : finished_) {
            auto it = workers_.find(id);
            if (it == workers_.end()) continue;
            done.push_back(std::move(it->second.thread));
            workers_.erase(it);
        }
        finished_.clear();
    }
    // jthread destructors join; each of these has already left serve_connection.
}

void ApiServer::log(const std::string& msg) {
    if (log_) log_(msg);
}
