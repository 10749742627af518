#include "holepunch/core/cancellation.hpp"
#include "holepunch/core/config.hpp"
#include "holepunch/traversal/address_resolver.hpp"
#include "holepunch/traversal/orchestrator.hpp"
#include "holepunch/util/logger.hpp"
#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <pthread.h>
#include <unistd.h>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [OPTIONS] [config-file]\n"
              << "\n"
              << "Open a direct TCP stream to a peer behind NAT by TCP simultaneous open.\n"
              << "Once connected, stdin is sent to the peer and the peer's data is written\n"
              << "to stdout until either side closes.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help                Show this help message\n"
              << "  -v, --verbose             Enable verbose logging\n"
              << "  -d, --debug               Enable debug logging\n"
              << "  --local-port <port>       Local TCP port shared by listen and connect\n"
              << "  --remote <host:port>      Peer's candidate endpoint\n"
              << "  --listen-timeout <sec>    How long to wait for an inbound connection\n"
              << "  --max-attempts <n>        Outbound connect attempts\n"
              << "  --overall-timeout <sec>   Upper bound for the whole traversal\n"
              << "  --show-addresses          Print local and public IP, then exit\n"
              << "  --generate-config         Print a sample configuration\n"
              << "\n"
              << "Both peers run with each other's endpoint and the same local port:\n"
              << "  host A: " << program << " --local-port 40000 --remote <B-ip>:40000\n"
              << "  host B: " << program << " --local-port 40000 --remote <A-ip>:40000\n";
}

// Delivers SIGINT/SIGTERM on a dedicated thread so cancellation runs
// outside signal-handler context.
class SignalWatcher {
public:
    template<typename Callback>
    explicit SignalWatcher(Callback on_signal) {
        thread_ = std::thread([this, on_signal] {
            sigset_t set;
            sigemptyset(&set);
            sigaddset(&set, SIGINT);
            sigaddset(&set, SIGTERM);
            timespec interval{0, 200 * 1000 * 1000};

            while (!done_.load()) {
                int signum = sigtimedwait(&set, nullptr, &interval);
                if (signum > 0) {
                    on_signal(signum);
                }
            }
        });
    }

    ~SignalWatcher() {
        done_.store(true);
        thread_.join();
    }

    // Must run before any other thread starts so they inherit the mask
    static void block_signals() {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);
    }

private:
    std::atomic<bool> done_{false};
    std::thread thread_;
};

bool write_stdout(const uint8_t* data, size_t len) {
    while (len > 0) {
        ssize_t written = ::write(STDOUT_FILENO, data, len);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        len -= static_cast<size_t>(written);
    }
    return true;
}

// Shuttle bytes between stdin/stdout and the stream until the peer closes
// or shutdown is requested.
void relay(holepunch::traversal::StreamHandle& stream,
           const holepunch::core::CancellationToken& shutdown) {
    std::array<uint8_t, 16384> buffer;
    size_t bytes_out = 0;
    size_t bytes_in = 0;

    std::array<pollfd, 3> fds{};
    fds[0] = {STDIN_FILENO, POLLIN, 0};
    fds[1] = {stream.fd(), POLLIN, 0};
    fds[2] = {shutdown.wake_fd(), POLLIN, 0};

    while (true) {
        int ready = ::poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("poll failed: {}", std::strerror(errno));
            break;
        }

        if (fds[2].revents != 0) {
            LOG_INFO("Shutting down relay");
            break;
        }

        if (fds[0].revents != 0) {
            ssize_t n = ::read(STDIN_FILENO, buffer.data(), buffer.size());
            if (n > 0) {
                if (!stream.write_all({buffer.data(), static_cast<size_t>(n)})) {
                    LOG_ERROR("Send to peer failed: {}",
                              std::strerror(stream.socket().last_error()));
                    break;
                }
                bytes_out += static_cast<size_t>(n);
            } else if (n == 0 || errno != EINTR) {
                // End of input; keep reading until the peer is done too
                if (!stream.close_write()) {
                    LOG_DEBUG("shutdown(SHUT_WR) failed: {}",
                              std::strerror(stream.socket().last_error()));
                }
                fds[0].fd = -1;
            }
        }

        if (fds[1].revents != 0) {
            ssize_t n = stream.read_some(buffer);
            if (n == 0) {
                LOG_INFO("Peer closed the connection");
                break;
            }
            if (n < 0) {
                if (stream.socket().last_error() == EINTR) continue;
                LOG_ERROR("Receive from peer failed: {}",
                          std::strerror(stream.socket().last_error()));
                break;
            }
            if (!write_stdout(buffer.data(), static_cast<size_t>(n))) {
                LOG_ERROR("Write to stdout failed: {}", std::strerror(errno));
                break;
            }
            bytes_in += static_cast<size_t>(n);
        }
    }

    LOG_INFO("Relay finished: {} bytes sent, {} bytes received", bytes_out, bytes_in);
}

int show_addresses(const holepunch::core::PunchConfig& config) {
    holepunch::traversal::AddressResolver resolver(config.make_probes(),
                                                   config.resolver_options());
    std::cout << "Local IP:  " << resolver.local_address().to_string() << "\n";
    std::cout << "Public IP: " << resolver.public_address().to_string() << "\n";
    return 0;
}

int run_traversal(const holepunch::core::PunchConfig& config) {
    auto traversal_config = config.to_traversal_config();
    if (!traversal_config) {
        LOG_FATAL("Failed to resolve configuration");
        return 1;
    }

    holepunch::core::CancellationToken shutdown;
    // Share the port on the wildcard address of the remote's family
    const auto& remote_ip = traversal_config->remote_endpoint.address();
    holepunch::net::ReusableSocketFactory factory(
        remote_ip.is_v4() ? holepunch::net::IpAddress(holepunch::net::IPv4Address::any())
                          : holepunch::net::IpAddress(holepunch::net::IPv6Address::any()));
    holepunch::traversal::TraversalOrchestrator orchestrator(
        holepunch::traversal::LogEventSink::instance(), factory);

    SignalWatcher watcher([&](int signum) {
        LOG_INFO("Received signal {}, shutting down...", signum);
        shutdown.cancel();
        orchestrator.cancel();
    });

    LOG_INFO("Local port {}, remote {}", traversal_config->local_port,
             traversal_config->remote_endpoint.to_string());

    auto result = orchestrator.simultaneous_open(*traversal_config);
    if (!result.stream) {
        LOG_ERROR("No connection: {}", result.describe());
        return 1;
    }

    LOG_INFO("Connected: {}", result.describe());
    if (!result.stream->socket().set_nodelay(true)) {
        LOG_DEBUG("TCP_NODELAY not set: {}", std::strerror(result.stream->socket().last_error()));
    }
    if (!shutdown.cancelled()) {
        relay(*result.stream, shutdown);
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::optional<holepunch::util::LogLevel> cli_log_level;
    bool generate_config = false;
    bool addresses_only = false;

    // (section, key, value) applied on top of the config file
    std::vector<std::array<std::string, 3>> overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--verbose") {
            cli_log_level = holepunch::util::LogLevel::Debug;
        } else if (arg == "-d" || arg == "--debug") {
            cli_log_level = holepunch::util::LogLevel::Trace;
        } else if (arg == "--generate-config") {
            generate_config = true;
        } else if (arg == "--show-addresses") {
            addresses_only = true;
        } else if (arg == "--local-port" && i + 1 < argc) {
            overrides.push_back({"Traversal", "LocalPort", argv[++i]});
        } else if (arg == "--remote" && i + 1 < argc) {
            overrides.push_back({"Traversal", "RemoteEndpoint", argv[++i]});
        } else if (arg == "--listen-timeout" && i + 1 < argc) {
            overrides.push_back({"Traversal", "ListenTimeout", argv[++i]});
        } else if (arg == "--max-attempts" && i + 1 < argc) {
            overrides.push_back({"Traversal", "MaxConnectAttempts", argv[++i]});
        } else if (arg == "--overall-timeout" && i + 1 < argc) {
            overrides.push_back({"Traversal", "OverallTimeout", argv[++i]});
        } else if (arg[0] != '-') {
            config_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (generate_config) {
        std::cout << holepunch::core::PunchConfig::generate_sample();
        return 0;
    }

    holepunch::core::PunchConfig config;
    if (!config_path.empty()) {
        auto parsed = holepunch::core::PunchConfig::parse_file(config_path);
        if (!parsed) {
            LOG_FATAL("Failed to parse configuration file: {}", config_path);
            return 1;
        }
        config = std::move(*parsed);
    }

    for (const auto& [section, key, value] : overrides) {
        if (!config.set(section, key, value)) {
            std::cerr << "Error: invalid value '" << value << "' for " << key << "\n\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    auto log_level = cli_log_level ? cli_log_level : holepunch::util::parse_log_level(config.log_level);
    if (!log_level) {
        LOG_FATAL("Unknown log level: {}", config.log_level);
        return 1;
    }
    holepunch::util::Logger::instance().set_level(*log_level);

    try {
        if (addresses_only) {
            return show_addresses(config);
        }

        if (!config.validate()) {
            std::cerr << "Error: invalid configuration (a local port and a remote host:port are required)\n\n";
            print_usage(argv[0]);
            return 1;
        }

        SignalWatcher::block_signals();
        return run_traversal(config);
    } catch (const std::exception& e) {
        LOG_FATAL("Fatal error: {}", e.what());
        return 1;
    }
}
