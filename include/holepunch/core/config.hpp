#pragma once

#include "holepunch/traversal/address_resolver.hpp"
#include "holepunch/traversal/types.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace holepunch::core {

// Hole punch configuration, read from an INI-style file:
//
//   [Traversal]  LocalPort, RemoteEndpoint, ListenTimeout, ConnectAttemptDelay,
//                MaxConnectAttempts, ConnectAttemptTimeout, OverallTimeout,
//                StartupStagger
//   [Discovery]  LocalProbe, ProbeTimeout, Probe (repeatable)
//   [Log]        Level
//
// Durations are given in seconds and may be fractional.
struct PunchConfig {
    // [Traversal]
    uint16_t local_port = 0;
    std::string remote_endpoint;  // host:port, resolved by to_traversal_config()
    std::chrono::milliseconds listen_timeout{30000};
    std::chrono::milliseconds connect_attempt_delay{500};
    int max_connect_attempts = 10;
    std::chrono::milliseconds connect_attempt_timeout{2000};
    std::chrono::milliseconds overall_timeout{35000};
    std::chrono::milliseconds startup_stagger{500};

    // [Discovery]
    std::string local_probe = "8.8.8.8:80";
    std::chrono::milliseconds probe_timeout{5000};
    std::vector<std::string> probe_urls;  // Empty = built-in list

    // [Log]
    std::string log_level = "info";

    // Parse from config file
    static std::optional<PunchConfig> parse_file(const std::string& path);

    // Parse from string. Malformed numbers yield nullopt.
    static std::optional<PunchConfig> parse(const std::string& content);

    // Assign one setting, e.g. set("Traversal", "LocalPort", "40000").
    // Names are case-insensitive; unknown keys are ignored. Returns false if
    // the value is malformed.
    bool set(const std::string& section, const std::string& key, const std::string& value);

    // Validate configuration
    bool validate() const;

    // Generate sample config
    static std::string generate_sample();

    // Resolve RemoteEndpoint (may block on DNS). Nullopt if invalid.
    std::optional<traversal::TraversalConfig> to_traversal_config() const;

    traversal::AddressResolver::Options resolver_options() const;
    std::vector<std::unique_ptr<traversal::AddressProbe>> make_probes() const;
};

} // namespace holepunch::core
