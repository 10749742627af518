#include "holepunch/core/config.hpp"
#include "holepunch/util/logger.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <format>
#include <sstream>

namespace holepunch::core {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return str;
}

std::pair<std::string, std::string> parse_line(const std::string& line) {
    auto eq = line.find('=');
    if (eq == std::string::npos) {
        return {trim(line), ""};
    }
    return {trim(line.substr(0, eq)), trim(line.substr(eq + 1))};
}

template<typename T>
std::optional<T> parse_integer(const std::string& value) {
    T result{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

// "2", "0.5", "30.25" seconds
std::optional<std::chrono::milliseconds> parse_seconds(const std::string& value) {
    double seconds = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
    if (ec != std::errc() || ptr != value.data() + value.size() || !std::isfinite(seconds)) {
        return std::nullopt;
    }
    // Out of range for llround; validate() applies the real limit
    if (std::fabs(seconds) > 1e12) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

std::string format_seconds(std::chrono::milliseconds value) {
    if (value.count() % 1000 == 0) {
        return std::to_string(value.count() / 1000);
    }
    return std::format("{}", static_cast<double>(value.count()) / 1000.0);
}

} // anonymous namespace

std::optional<PunchConfig> PunchConfig::parse_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

bool PunchConfig::set(const std::string& section, const std::string& key, const std::string& value) {
    auto sect = to_lower(section);
    auto name = to_lower(key);

    if (sect == "traversal") {
        if (name == "localport") {
            auto port = parse_integer<uint16_t>(value);
            if (!port) return false;
            local_port = *port;
        } else if (name == "remoteendpoint") {
            remote_endpoint = value;
        } else if (name == "maxconnectattempts") {
            auto attempts = parse_integer<int>(value);
            if (!attempts) return false;
            max_connect_attempts = *attempts;
        } else {
            std::chrono::milliseconds* target = nullptr;
            if (name == "listentimeout") {
                target = &listen_timeout;
            } else if (name == "connectattemptdelay") {
                target = &connect_attempt_delay;
            } else if (name == "connectattempttimeout") {
                target = &connect_attempt_timeout;
            } else if (name == "overalltimeout") {
                target = &overall_timeout;
            } else if (name == "startupstagger") {
                target = &startup_stagger;
            }

            if (target) {
                auto duration = parse_seconds(value);
                if (!duration) return false;
                *target = *duration;
            }
        }
    } else if (sect == "discovery") {
        if (name == "localprobe") {
            local_probe = value;
        } else if (name == "probetimeout") {
            auto duration = parse_seconds(value);
            if (!duration) return false;
            probe_timeout = *duration;
        } else if (name == "probe") {
            probe_urls.push_back(value);
        }
    } else if (sect == "log") {
        if (name == "level") {
            log_level = to_lower(value);
        }
    }

    return true;
}

std::optional<PunchConfig> PunchConfig::parse(const std::string& content) {
    PunchConfig config;
    std::istringstream stream(content);
    std::string line;
    std::string section;
    int line_number = 0;

    while (std::getline(stream, line)) {
        ++line_number;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            section = to_lower(trim(line.substr(1, line.find(']') - 1)));
            if (section != "traversal" && section != "discovery" && section != "log") {
                LOG_WARNING("Config line {}: ignoring unknown section [{}]", line_number, section);
            }
            continue;
        }

        auto [key, value] = parse_line(line);
        if (!config.set(section, key, value)) {
            LOG_ERROR("Config line {}: invalid value '{}' for {}", line_number, value, key);
            return std::nullopt;
        }
    }

    return config;
}

bool PunchConfig::validate() const {
    if (local_port == 0) {
        return false;
    }

    // Must look like host:port; the host is resolved later
    auto colon = remote_endpoint.rfind(':');
    if (remote_endpoint.empty() || colon == std::string::npos || colon == 0) {
        return false;
    }
    auto remote_port = parse_integer<uint16_t>(remote_endpoint.substr(colon + 1));
    if (!remote_port || *remote_port == 0) {
        return false;
    }

    if (max_connect_attempts < 1) {
        return false;
    }

    if (listen_timeout.count() <= 0 || connect_attempt_timeout.count() <= 0 ||
        overall_timeout.count() <= 0 || probe_timeout.count() <= 0) {
        return false;
    }

    if (connect_attempt_delay.count() < 0 || startup_stagger.count() < 0) {
        return false;
    }

    for (auto value : {listen_timeout, connect_attempt_delay, connect_attempt_timeout,
                       overall_timeout, startup_stagger, probe_timeout}) {
        if (value > traversal::max_duration) {
            return false;
        }
    }

    if (!net::SocketAddress::parse(local_probe)) {
        return false;
    }

    if (std::any_of(probe_urls.begin(), probe_urls.end(),
                    [](const std::string& url) { return url.empty(); })) {
        return false;
    }

    return util::parse_log_level(log_level).has_value();
}

std::string PunchConfig::generate_sample() {
    PunchConfig defaults;

    std::ostringstream oss;
    oss << "[Traversal]\n";
    oss << "# Local TCP port, shared by the listener and every outbound attempt\n";
    oss << "LocalPort = 40000\n";
    oss << "# Peer's candidate endpoint (host:port)\n";
    oss << "RemoteEndpoint = 203.0.113.7:40000\n";
    oss << "# All durations are in seconds\n";
    oss << "ListenTimeout = " << format_seconds(defaults.listen_timeout) << "\n";
    oss << "ConnectAttemptDelay = " << format_seconds(defaults.connect_attempt_delay) << "\n";
    oss << "MaxConnectAttempts = " << defaults.max_connect_attempts << "\n";
    oss << "ConnectAttemptTimeout = " << format_seconds(defaults.connect_attempt_timeout) << "\n";
    oss << "OverallTimeout = " << format_seconds(defaults.overall_timeout) << "\n";
    oss << "StartupStagger = " << format_seconds(defaults.startup_stagger) << "\n";
    oss << "\n";
    oss << "[Discovery]\n";
    oss << "# Destination used to find the outbound interface (no data is sent)\n";
    oss << "LocalProbe = " << defaults.local_probe << "\n";
    oss << "ProbeTimeout = " << format_seconds(defaults.probe_timeout) << "\n";
    oss << "# Public IP echo services, tried in order (omit for the built-in list)\n";
    oss << "# Probe = https://api.ipify.org?format=text\n";
    oss << "# Probe = https://icanhazip.com\n";
    oss << "\n";
    oss << "[Log]\n";
    oss << "# trace, debug, info, warning, error, fatal\n";
    oss << "Level = " << defaults.log_level << "\n";

    return oss.str();
}

std::optional<traversal::TraversalConfig> PunchConfig::to_traversal_config() const {
    if (!validate()) {
        return std::nullopt;
    }

    auto remote = net::SocketAddress::resolve(remote_endpoint);
    if (!remote) {
        LOG_ERROR("Cannot resolve remote endpoint {}", remote_endpoint);
        return std::nullopt;
    }

    traversal::TraversalConfig traversal;
    traversal.local_port = local_port;
    traversal.remote_endpoint = *remote;
    traversal.listen_timeout = listen_timeout;
    traversal.connect_attempt_delay = connect_attempt_delay;
    traversal.max_connect_attempts = max_connect_attempts;
    traversal.connect_attempt_timeout = connect_attempt_timeout;
    traversal.overall_timeout = overall_timeout;
    traversal.startup_stagger = startup_stagger;
    return traversal;
}

traversal::AddressResolver::Options PunchConfig::resolver_options() const {
    traversal::AddressResolver::Options options;
    if (auto probe = net::SocketAddress::parse(local_probe)) {
        options.local_probe = *probe;
    }
    options.probe_timeout = probe_timeout;
    return options;
}

std::vector<std::unique_ptr<traversal::AddressProbe>> PunchConfig::make_probes() const {
    if (probe_urls.empty()) {
        return traversal::AddressResolver::default_probes();
    }

    std::vector<std::unique_ptr<traversal::AddressProbe>> probes;
    for (const auto& url : probe_urls) {
        probes.push_back(std::make_unique<traversal::HttpEchoProbe>(url));
    }
    return probes;
}

} // namespace holepunch::core
