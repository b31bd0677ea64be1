#include <catch2/catch_test_macros.hpp>

#include "api_server.hpp"
#include "test_support.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <arpa/inet.h>
#include <atomic>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace std::chrono_literals;
using test_support::http_exchange;
using test_support::HttpReply;
using test_support::Part;
using test_support::RecordingEngine;
using test_support::StubDecoder;
using test_support::transcription_request;

namespace {

Config test_config() {
    Config cfg;
    cfg.server.read_timeout_s = 5;
    cfg.model.model_name = "whisper-test";
    return cfg;
}

const std::vector<Part> kAudioForm = {
    {"file", "fake-audio", "speech.wav"},
    {"model", "whisper-1", std::nullopt},
};

// Server whose worker threads can be made to fail to start.
class ThreadLimitedServer : public ApiServer {
public:
    using ApiServer::ApiServer;
    ~ThreadLimitedServer() override { stop(); }

    std::atomic<bool> refuse_threads{false};

protected:
    std::jthread launch_worker(std::function<void()> body) override {
        if (refuse_threads) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        return ApiServer::launch_worker(std::move(body));
    }
};

// Restores the descriptor limit when the test ends, even on failure.
struct FdLimitGuard {
    rlimit saved{};

    FdLimitGuard() { REQUIRE(::getrlimit(RLIMIT_NOFILE, &saved) == 0); }
    ~FdLimitGuard() { ::setrlimit(RLIMIT_NOFILE, &saved); }

    void restore() { REQUIRE(::setrlimit(RLIMIT_NOFILE, &saved) == 0); }

    // Every descriptor the process opens from now on fails with EMFILE.
    void exhaust() {
        int lowest_free = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        REQUIRE(lowest_free >= 0);
        ::close(lowest_free);

        rlimit tight = saved;
        tight.rlim_cur = static_cast<rlim_t>(lowest_free);
        REQUIRE(::setrlimit(RLIMIT_NOFILE, &tight) == 0);
    }
};

} // namespace

TEST_CASE("ApiServer lifecycle", "[server]") {
    auto engine = std::make_shared<RecordingEngine>();
    StubDecoder decoder;
    ApiServer server(test_config(), engine, decoder);

    REQUIRE(server.state() == ServerState::Stopped);
    REQUIRE_FALSE(server.is_running());

    SECTION("StartAndStop") {
        REQUIRE(server.start("127.0.0.1", 0));
        REQUIRE(server.is_running());
        REQUIRE(server.port() != 0);

        server.stop();
        REQUIRE(server.state() == ServerState::Stopped);
    }

    SECTION("StartTwiceIsNoOp") {
        REQUIRE(server.start("127.0.0.1", 0));
        auto port = server.port();
        REQUIRE(server.start("127.0.0.1", 0));
        REQUIRE(server.port() == port);
        server.stop();
    }

    SECTION("StopWhenStoppedIsNoOp") {
        server.stop();
        REQUIRE(server.state() == ServerState::Stopped);
        REQUIRE(server.start("127.0.0.1", 0));
        server.stop();
        server.stop();
        REQUIRE(server.state() == ServerState::Stopped);
    }

    SECTION("RestartAfterStop") {
        REQUIRE(server.start("127.0.0.1", 0));
        server.stop();
        REQUIRE(server.start("127.0.0.1", 0));

        auto reply = http_exchange(server.port(), "GET /v1/models HTTP/1.1\r\n\r\n");
        REQUIRE(reply.has_value());
        REQUIRE(reply->status == 200);
        server.stop();
    }

    SECTION("BindFailureLeavesServerStopped") {
        REQUIRE(server.start("127.0.0.1", 0));
        auto taken = server.port();

        StubDecoder other_decoder;
        ApiServer other(test_config(), engine, other_decoder);
        REQUIRE_FALSE(other.start("127.0.0.1", taken));
        REQUIRE(other.state() == ServerState::Stopped);

        // The first server is unaffected.
        auto reply = http_exchange(taken, "GET /v1/models HTTP/1.1\r\n\r\n");
        REQUIRE(reply.has_value());
        REQUIRE(reply->status == 200);
    }
}

TEST_CASE("ApiServer endpoints", "[server]") {
    auto engine = std::make_shared<RecordingEngine>();
    StubDecoder decoder;
    std::mutex log_mutex;
    std::vector<std::string> lines;
    ApiServer server(test_config(), engine, decoder, [&](const std::string& l) {
        std::lock_guard lock(log_mutex);
        lines.push_back(l);
    });
    REQUIRE(server.start("127.0.0.1", 0));
    auto port = server.port();

    SECTION("ListModels") {
        auto reply = http_exchange(port, "GET /v1/models HTTP/1.1\r\nHost: x\r\n\r\n");
        REQUIRE(reply.has_value());
        REQUIRE(reply->status == 200);
        REQUIRE(reply->head.find("Content-Type: application/json") != std::string::npos);
        REQUIRE(reply->head.find("Connection: close") != std::string::npos);

        auto j = reply->json();
        REQUIRE(j["object"] == "list");
        REQUIRE(j["data"][0]["id"] == "whisper-test");
    }

    SECTION("UnknownRoute") {
        auto reply = http_exchange(port, "GET /health HTTP/1.1\r\n\r\n");
        REQUIRE(reply.has_value());
        REQUIRE(reply->status == 404);
        REQUIRE(reply->json()["error"]["message"] == "Not found");
    }

    SECTION("MalformedRequest") {
        auto reply = http_exchange(port, "nonsense\r\n\r\n");
        REQUIRE(reply.has_value());
        REQUIRE(reply->status == 400);
        REQUIRE(reply->json()["error"]["message"] == "Malformed request line");
    }

    SECTION("Transcription") {
        auto reply = http_exchange(port, transcription_request(kAudioForm));
        REQUIRE(reply.has_value());
        REQUIRE(reply->status == 200);
        REQUIRE(reply->body == R"({"text":"Hello world."})");
        REQUIRE(engine->calls.load() == 1);
    }

    SECTION("TranscriptionWithExpectContinue") {
        std::string body = test_support::multipart_body("b0undary", kAudioForm);
        std::string head =
            "POST /v1/audio/transcriptions HTTP/1.1\r\n"
            "Content-Type: multipart/form-data; boundary=b0undary\r\n"
            "Expect: 100-continue\r\n"
            "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";

        int fd = test_support::connect_loopback(port);
        REQUIRE(fd >= 0);
        REQUIRE(test_support::send_all(fd, head));

        char interim[64] = {};
        ssize_t n = ::recv(fd, interim, sizeof(interim) - 1, 0);
        REQUIRE(n > 0);
        REQUIRE(std::string(interim).starts_with("HTTP/1.1 100 Continue"));

        REQUIRE(test_support::send_all(fd, body));
        auto reply = test_support::read_reply(fd);
        ::close(fd);
        REQUIRE(reply.has_value());
        REQUIRE(reply->status == 200);
    }

    SECTION("MissingFile") {
        auto reply = http_exchange(port, transcription_request({{"model", "whisper-1", std::nullopt}}));
        REQUIRE(reply.has_value());
        REQUIRE(reply->status == 400);
        REQUIRE(reply->json()["error"]["message"] == "Missing required field: file");
        REQUIRE(reply->json()["error"]["type"] == "invalid_request_error");
        REQUIRE(reply->json()["error"]["code"].is_null());
    }

    SECTION("WrongContentType") {
        auto reply = http_exchange(port, test_support::post_request(
            "/v1/audio/transcriptions", "application/json", R"({"file":"x"})"));
        REQUIRE(reply.has_value());
        REQUIRE(reply->status == 400);
        REQUIRE(engine->calls.load() == 0);
    }

    SECTION("BodyTooLarge") {
        Config cfg = test_config();
        cfg.server.max_body_bytes = 64;
        StubDecoder small_decoder;
        ApiServer small(cfg, engine, small_decoder);
        REQUIRE(small.start("127.0.0.1", 0));

        auto reply = http_exchange(small.port(), transcription_request(kAudioForm));
        REQUIRE(reply.has_value());
        REQUIRE(reply->status == 413);
        REQUIRE(engine->calls.load() == 0);
    }

    SECTION("AccessLogged") {
        REQUIRE(http_exchange(port, "GET /v1/models HTTP/1.1\r\n\r\n").has_value());
        server.stop();

        std::lock_guard lock(log_mutex);
        bool found = false;
        for (const auto& l : lines) {
            if (l == "API: \"GET /v1/models\" 200") found = true;
        }
        REQUIRE(found);
    }

    server.stop();
}

TEST_CASE("ApiServer survives resource exhaustion", "[server]") {
    auto engine = std::make_shared<RecordingEngine>();
    StubDecoder decoder;
    ThreadLimitedServer server(test_config(), engine, decoder);
    REQUIRE(server.start("127.0.0.1", 0));
    auto port = server.port();

    SECTION("WorkerThreadFailureRejectsConnection") {
        server.refuse_threads = true;

        int fd = test_support::connect_loopback(port);
        REQUIRE(fd >= 0);
        auto reply = test_support::read_reply(fd);
        ::close(fd);
        REQUIRE(reply.has_value());
        REQUIRE(reply->status == 503);
        REQUIRE(reply->json()["error"]["message"] == "Server is busy, try again later");
        REQUIRE(server.is_running());

        server.refuse_threads = false;
        auto ok = http_exchange(port, "GET /v1/models HTTP/1.1\r\n\r\n");
        REQUIRE(ok.has_value());
        REQUIRE(ok->status == 200);
    }

    SECTION("AcceptRecoversAfterDescriptorExhaustion") {
        // The client socket exists before the limit drops; connect() needs no new fd.
        int client = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        REQUIRE(client >= 0);
        timeval tv{.tv_sec = 10, .tv_usec = 0};
        ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

        {
            FdLimitGuard limit;
            limit.exhaust();
            REQUIRE(::connect(client, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

            // The server cannot accept during this window.
            std::this_thread::sleep_for(300ms);
            REQUIRE(server.is_running());
            limit.restore();
        }

        REQUIRE(test_support::send_all(client, "GET /v1/models HTTP/1.1\r\n\r\n"));
        auto reply = test_support::read_reply(client);
        ::close(client);
        REQUIRE(reply.has_value());
        REQUIRE(reply->status == 200);
    }

    server.stop();
}

TEST_CASE("ApiServer without engine", "[server]") {
    StubDecoder decoder;
    ApiServer server(test_config(), nullptr, decoder);
    REQUIRE(server.start("127.0.0.1", 0));

    auto reply = http_exchange(server.port(), transcription_request(kAudioForm));
    REQUIRE(reply.has_value());
    REQUIRE(reply->status == 503);
    REQUIRE(reply->json()["error"]["message"] == "Local model not available");
    REQUIRE(decoder.calls.load() == 0);

    auto models = http_exchange(server.port(), "GET /v1/models HTTP/1.1\r\n\r\n");
    REQUIRE(models.has_value());
    REQUIRE(models->status == 200);
}

TEST_CASE("ApiServer concurrency", "[server]") {
    auto engine = std::make_shared<RecordingEngine>();
    StubDecoder decoder;
    ApiServer server(test_config(), engine, decoder);
    REQUIRE(server.start("127.0.0.1", 0));
    auto port = server.port();

    SECTION("EngineCallsAreSerialized") {
        decoder.delay = 300ms;
        engine->delay = 100ms;

        std::vector<std::optional<HttpReply>> replies(3);
        std::vector<std::thread> clients;
        for (size_t i = 0; i < replies.size(); ++i) {
            clients.emplace_back([&, i] { replies[i] = http_exchange(port, transcription_request(kAudioForm)); });
        }
        for (auto& c : clients) c.join();

        for (const auto& r : replies) {
            REQUIRE(r.has_value());
            REQUIRE(r->status == 200);
        }
        REQUIRE(engine->calls.load() == 3);
        REQUIRE(engine->max_in_flight.load() == 1);
        // Decoding runs outside the engine lock.
        REQUIRE(decoder.max_in_flight.load() >= 2);
    }

    SECTION("StalledUploadDoesNotBlockOthers") {
        std::string request = transcription_request(kAudioForm);

        // Client A sends only half its request and then goes quiet.
        int stalled = test_support::connect_loopback(port);
        REQUIRE(stalled >= 0);
        REQUIRE(test_support::send_all(stalled, request.substr(0, request.size() / 2)));

        auto started = std::chrono::steady_clock::now();
        auto reply = http_exchange(port, request);
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE(reply.has_value());
        REQUIRE(reply->status == 200);
        REQUIRE(elapsed < 3s);
        ::close(stalled);
    }

    SECTION("StopDuringDecode") {
        decoder.delay = 300ms;

        std::optional<HttpReply> reply;
        std::thread client([&] { reply = http_exchange(port, transcription_request(kAudioForm)); });

        // Let the worker get into the decoder before stopping.
        for (int i = 0; i < 100 && decoder.calls.load() == 0; ++i) {
            std::this_thread::sleep_for(10ms);
        }
        REQUIRE(decoder.calls.load() == 1);

        server.stop();
        REQUIRE(server.state() == ServerState::Stopped);
        client.join();

        // The in-flight request still finished.
        REQUIRE(reply.has_value());
        REQUIRE(reply->status == 200);
    }

    SECTION("StopWithIdleConnection") {
        int idle = test_support::connect_loopback(port);
        REQUIRE(idle >= 0);
        std::this_thread::sleep_for(50ms);

        auto started = std::chrono::steady_clock::now();
        server.stop();
        REQUIRE(std::chrono::steady_clock::now() - started < 3s);
        REQUIRE(server.state() == ServerState::Stopped);
        ::close(idle);
    }

    server.stop();
}
