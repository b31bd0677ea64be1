#pragma once

#include "audio/audio_decoder.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "http/http_connection.hpp"
#include "whisper/engine.hpp"
#include "whisper/engine_gateway.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

enum class ServerState { Stopped, Starting, Running, Stopping };

// OpenAI-compatible transcription endpoint over plain TCP. One accept thread,
// one worker thread per connection, one request per connection.
class ApiServer {
public:
    using LogSink = Dispatcher::LogSink;

    // engine may be null: transcription requests then answer 503.
    // decoder must outlive the server.
    ApiServer(Config config, std::shared_ptr<TranscriptionEngine> engine,
              AudioDecoder& decoder, LogSink log = {});
    virtual ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    // Port 0 binds an ephemeral port, see port(). Returns false and stays
    // Stopped if the address cannot be bound. No-op while running.
    bool start(const std::string& host, uint16_t port);

    // Stops accepting, unblocks reads of in-flight connections and waits for
    // their workers. No-op while stopped.
    void stop();

    ServerState state() const { return state_.load(std::memory_order_acquire); }
    bool is_running() const { return state() == ServerState::Running; }
    uint16_t port() const { return port_; }

protected:
    // Starts the thread serving one connection. May throw std::system_error
    // when the system is out of threads.
    virtual std::jthread launch_worker(std::function<void()> body);

private:
    struct Worker {
        int fd = -1; // -1 once the worker has closed its socket
        std::jthread thread;
    };

    bool open_listener(const std::string& host, uint16_t port);
    void accept_loop();
    void spawn_worker(int fd);
    void reject_connection(int fd, const ApiError& error);
    void serve_connection(uint64_t id, int fd);
    void handle_connection(HttpConnection& conn);
    void release_fd(uint64_t id);
    void reap_finished();
    void log(const std::string& msg);

    Config config_;
    LogSink log_;
    EngineGateway gateway_;
    Dispatcher dispatcher_;

    std::mutex lifecycle_mutex_;
    std::atomic<ServerState> state_{ServerState::Stopped};
    int listen_fd_ = -1;
    int wake_fd_ = -1;
    uint16_t port_ = 0;
    std::jthread accept_thread_;

    std::mutex workers_mutex_;
    std::unordered_map<uint64_t, Worker> workers_;
    std::vector<uint64_t> finished_;
    uint64_t next_worker_id_ = 0;
};
