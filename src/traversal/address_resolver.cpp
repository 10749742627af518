#include "holepunch/traversal/address_resolver.hpp"
#include "holepunch/net/udp_socket.hpp"
#include "holepunch/util/logger.hpp"
#include <cstring>
#include <exception>
#include <format>
#include <mutex>

#include <curl/curl.h>

namespace holepunch::traversal {

namespace {

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

bool ensure_curl_initialized() {
    static std::once_flag once;
    static CURLcode init_result = CURLE_FAILED_INIT;
    std::call_once(once, [] { init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
    return init_result == CURLE_OK;
}

size_t append_body(char* data, size_t size, size_t count, void* user) {
    auto* body = static_cast<std::string*>(user);
    body->append(data, size * count);
    return size * count;
}

std::string_view trim(std::string_view str) {
    constexpr const char* whitespace = " \t\r\n";
    auto start = str.find_first_not_of(whitespace);
    if (start == std::string_view::npos) return {};
    auto end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

} // anonymous namespace

HttpEchoProbe::HttpEchoProbe(std::string url)
    : url_(std::move(url))
{}

std::optional<std::string> HttpEchoProbe::query(Duration timeout) {
    if (!ensure_curl_initialized()) {
        LOG_ERROR("curl_global_init failed");
        return std::nullopt;
    }

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return std::nullopt;
    }

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "holepunch/1.0");
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        LOG_DEBUG("{}: {}", url_, curl_easy_strerror(rc));
        return std::nullopt;
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        LOG_DEBUG("{}: HTTP {}", url_, status);
        return std::nullopt;
    }

    return body;
}

std::vector<std::unique_ptr<AddressProbe>> AddressResolver::default_probes() {
    std::vector<std::unique_ptr<AddressProbe>> probes;
    probes.push_back(std::make_unique<HttpEchoProbe>("https://api.ipify.org?format=text"));
    probes.push_back(std::make_unique<HttpEchoProbe>("https://icanhazip.com"));
    probes.push_back(std::make_unique<HttpEchoProbe>("https://ifconfig.me/ip"));
    return probes;
}

AddressResolver::AddressResolver(std::vector<std::unique_ptr<AddressProbe>> probes,
                                 Options options,
                                 EventSink& events)
    : probes_(std::move(probes))
    , options_(std::move(options))
    , events_(events)
{}

AddressResolver::AddressResolver(EventSink& events)
    : AddressResolver(default_probes(), Options{}, events)
{}

net::IpAddress AddressResolver::degraded(const std::string& reason) const {
    events_.on_event({EventKind::AddressResolutionDegraded, options_.local_probe, 0, 0, 0,
                      std::format("{}, using loopback", reason)});
    return net::IPv4Address::loopback();
}

net::IpAddress AddressResolver::local_address() const {
    net::UdpSocket probe;
    if (!probe.connect(options_.local_probe)) {
        return degraded(std::format("route lookup toward {} failed: {}",
                                    options_.local_probe.to_string(),
                                    std::strerror(probe.last_error())));
    }

    auto local = probe.local_address();
    if (!local || local->address().is_any()) {
        return degraded("no source address assigned");
    }
    return local->address();
}

net::IpAddress AddressResolver::public_address() const {
    for (const auto& probe : probes_) {
        std::optional<std::string> response;
        try {
            response = probe->query(options_.probe_timeout);
        } catch (const std::exception& e) {
            LOG_WARNING("Address probe {} threw: {}", probe->name(), e.what());
        }
        if (!response) {
            events_.on_event({EventKind::ProbeFailed, std::nullopt, 0, 0, 0, probe->name()});
            continue;
        }

        auto ip = net::IpAddress::parse(trim(*response));
        if (!ip) {
            events_.on_event({EventKind::ProbeFailed, std::nullopt, 0, 0, 0,
                              std::format("{} (unparsable response)", probe->name())});
            continue;
        }

        events_.on_event({EventKind::PublicAddressResolved, std::nullopt, 0, 0, 0,
                          std::format("{} from {}", ip->to_string(), probe->name())});
        return *ip;
    }

    return local_address();
}

} // namespace holepunch::traversal
