#include "api_server.hpp"
#include "audio/ffmpeg_decoder.hpp"
#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "whisper/lan_engine.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <format>
#include <memory>
#include <print>
#include <signal.h>
#include <string>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

void usage() {
    std::println("Usage: whisperwriter-api [options]");
    std::println("Options:");
    std::println("  -f, --foreground    Run in foreground (don't daemonize)");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -c, --config PATH   Config file path");
    std::println("      --host HOST     Listen address (overrides config)");
    std::println("      --port PORT     Listen port (overrides config)");
    std::println("  -h, --help          Show this help");
}

template <typename T>
bool parse_number(const std::string& s, T& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

std::shared_ptr<TranscriptionEngine> make_engine(const Config& config) {
    if (config.engine.type == "lan") {
        return std::make_shared<LanEngine>(config.engine.url, config.engine.api_format,
                                           config.model.model_name);
    }
    if (config.engine.type != "none") {
        std::println(stderr, "Unknown engine type: {}", config.engine.type);
    }
    return nullptr;
}

} // namespace

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;
    std::string host_override;
    int port_override = -1;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            host_override = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            if (!parse_number(argv[++i], port_override) || port_override < 0 || port_override > 65535) {
                std::println(stderr, "Invalid port: {}", argv[i]);
                return 1;
            }
        } else if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage();
            return 1;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!host_override.empty()) config.server.host = host_override;
    if (port_override >= 0) config.server.port = static_cast<uint16_t>(port_override);

    if (!foreground) {
        platform::daemonize();
    }

    auto log = [verbose](const std::string& msg) {
        if (verbose) std::println(stderr, "[whisperwriter-api] {}", msg);
    };

    log(std::format("Starting (engine: {} @ {}, model: {})",
                    config.engine.type, config.engine.url, config.model.model_name));

    // Block before any thread exists so every thread inherits the mask.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    int signal_fd = signalfd(-1, &mask, SFD_CLOEXEC);
    if (signal_fd < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return 1;
    }

    FfmpegDecoder decoder;
    ApiServer server(config, make_engine(config), decoder, log);

    if (!server.start(config.server.host, config.server.port)) {
        std::println(stderr, "Failed to start API server");
        ::close(signal_fd);
        return 1;
    }

    signalfd_siginfo info;
    while (::read(signal_fd, &info, sizeof(info)) < 0 && errno == EINTR) {
    }
    log("Received signal, shutting down");

    server.stop();
    ::close(signal_fd);
    return 0;
}
