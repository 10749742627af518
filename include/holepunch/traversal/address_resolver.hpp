#pragma once

#include "events.hpp"
#include "types.hpp"
#include "holepunch/net/address.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace holepunch::traversal {

// One source of this host's public address
class AddressProbe {
public:
    virtual ~AddressProbe() = default;

    virtual std::string name() const = 0;

    // Raw response body, or nullopt on any failure
    virtual std::optional<std::string> query(Duration timeout) = 0;
};

// Plain-text IP echo service queried over HTTP(S) with libcurl
class HttpEchoProbe : public AddressProbe {
public:
    explicit HttpEchoProbe(std::string url);

    std::string name() const override { return url_; }
    std::optional<std::string> query(Duration timeout) override;

private:
    std::string url_;
};

class AddressResolver {
public:
    struct Options {
        // Destination used to learn the outbound interface; nothing is sent
        net::SocketAddress local_probe{net::IPv4Address(8, 8, 8, 8), 80};
        Duration probe_timeout{5000};
    };

    // ipify, icanhazip, ifconfig.me, in that order
    static std::vector<std::unique_ptr<AddressProbe>> default_probes();

    AddressResolver(std::vector<std::unique_ptr<AddressProbe>> probes,
                    Options options,
                    EventSink& events = LogEventSink::instance());

    explicit AddressResolver(EventSink& events = LogEventSink::instance());

    // Source address the kernel picks toward local_probe. Falls back to
    // 127.0.0.1 on failure.
    net::IpAddress local_address() const;

    // First probe answer that parses as an IP, else local_address()
    net::IpAddress public_address() const;

    const Options& options() const { return options_; }

private:
    net::IpAddress degraded(const std::string& reason) const;

    std::vector<std::unique_ptr<AddressProbe>> probes_;
    Options options_;
    EventSink& events_;
};

} // namespace holepunch::traversal
