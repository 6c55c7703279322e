#include "suid/host/host_id.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <unistd.h>

#include <cstdlib>
#include <utility>
#include <random>
#include <vector>

#include <absl/log/log.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>

namespace suid::host {

namespace {

ResolvedHostId Masked(uint64_t value, uint64_t max_host_id, HostIdSource source) {
    const uint64_t masked = value & max_host_id;
    if (masked != value) {
        LOG(WARNING) << "[HostId] Host id " << value << " from " << HostIdSourceName(source)
                     << " exceeds maximum " << max_host_id << ", using " << masked;
    }
    return ResolvedHostId{masked, source};
}

std::optional<std::string> LocalHostname() {
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return std::nullopt;
    }
    return std::string(buffer);
}

}  // namespace

std::string_view HostIdSourceName(HostIdSource source) {
    switch (source) {
    case HostIdSource::kConfigured: return "configuration";
    case HostIdSource::kEnvironment: return "environment";
    case HostIdSource::kHostname: return "hostname";
    case HostIdSource::kNetwork: return "network";
    case HostIdSource::kRandom: return "random";
    }
    return "unknown";
}

ResolvedHostId FixedHostIdResolver::Resolve(uint64_t max_host_id) const {
    return Masked(host_id_, max_host_id, HostIdSource::kConfigured);
}

EnvironmentHostIdResolver::EnvironmentHostIdResolver(HostIdOptions options)
    : options_(std::move(options)) {
}

std::optional<std::string> EnvironmentHostIdResolver::Getenv(const std::string& name) const {
    if (options_.env_lookup) {
        return options_.env_lookup(name);
    }
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

ResolvedHostId EnvironmentHostIdResolver::Resolve(uint64_t max_host_id) const {
    if (options_.host_id) {
        return Masked(*options_.host_id, max_host_id, HostIdSource::kConfigured);
    }

    if (!options_.env_var.empty()) {
        if (auto value = Getenv(options_.env_var)) {
            uint64_t id = 0;
            if (absl::SimpleAtoi(*value, &id)) {
                return Masked(id, max_host_id, HostIdSource::kEnvironment);
            }
            LOG(WARNING) << "[HostId] Ignoring non-numeric " << options_.env_var << "=" << *value;
        }
    }

    if (options_.use_hostname) {
        std::optional<std::string> name = Getenv("POD_NAME");
        if (!name) {
            name = Getenv("HOSTNAME");
        }
        if (!name) {
            name = LocalHostname();
        }
        if (name) {
            if (auto id = ParseNameSuffix(*name)) {
                return Masked(*id, max_host_id, HostIdSource::kHostname);
            }
        }
    }

    if (options_.use_network) {
        if (auto ip = FindLocalIpv4()) {
            if (auto id = ParseLastOctet(*ip)) {
                return Masked(*id, max_host_id, HostIdSource::kNetwork);
            }
        }
    }

    std::random_device rd;
    std::mt19937_64 gen(rd());
    const uint64_t id = gen() & max_host_id;
    LOG(WARNING) << "[HostId] No host id configured, using random id " << id
                 << "; identifiers may collide with other hosts";
    return ResolvedHostId{id, HostIdSource::kRandom};
}

std::optional<uint64_t> ParseNameSuffix(std::string_view name) {
    std::vector<std::string_view> parts = absl::StrSplit(name, '-');
    if (parts.size() < 2) {
        return std::nullopt;
    }
    uint64_t id = 0;
    if (!absl::SimpleAtoi(parts.back(), &id)) {
        return std::nullopt;
    }
    return id;
}

std::optional<uint64_t> ParseLastOctet(std::string_view ipv4) {
    std::vector<std::string_view> parts = absl::StrSplit(ipv4, '.');
    if (parts.size() != 4) {
        return std::nullopt;
    }
    uint64_t octet = 0;
    if (!absl::SimpleAtoi(parts.back(), &octet) || octet > 255) {
        return std::nullopt;
    }
    return octet;
}

std::optional<std::string> FindLocalIpv4() {
    struct ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        return std::nullopt;
    }

    std::optional<std::string> result;
    for (struct ifaddrs* it = interfaces; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) {
            continue;
        }

        char buffer[INET_ADDRSTRLEN] = {};
        const auto* addr = reinterpret_cast<const struct sockaddr_in*>(it->ifa_addr);
        if (inet_ntop(AF_INET, &addr->sin_addr, buffer, sizeof(buffer)) != nullptr) {
            result = std::string(buffer);
            break;
        }
    }

    freeifaddrs(interfaces);
    return result;
}

}  // namespace suid::host
