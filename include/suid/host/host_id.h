#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace suid::host {

enum class HostIdSource {
    kConfigured,
    kEnvironment,
    kHostname,
    kNetwork,
    kRandom
};

std::string_view HostIdSourceName(HostIdSource source);

struct ResolvedHostId {
    uint64_t host_id = 0;
    HostIdSource source = HostIdSource::kConfigured;
};

/// Supplies the per-host tag embedded in every identifier. Called once per
/// generator; the result must not exceed `max_host_id`.
class HostIdResolver {
public:
    virtual ~HostIdResolver() = default;
    virtual ResolvedHostId Resolve(uint64_t max_host_id) const = 0;
};

/// Always returns the same id, masked to the requested range
class FixedHostIdResolver : public HostIdResolver {
public:
    explicit FixedHostIdResolver(uint64_t host_id) : host_id_(host_id) {}

    ResolvedHostId Resolve(uint64_t max_host_id) const override;

private:
    uint64_t host_id_;
};

/// Returns the value of an environment variable, nullopt when unset or empty
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

struct HostIdOptions {
    std::optional<uint64_t> host_id;
    std::string env_var = "SUID_HOST_ID";
    bool use_hostname = true;
    bool use_network = true;
    EnvLookup env_lookup;  // defaults to std::getenv
};

/// Resolution order, first hit wins:
///   1. options.host_id
///   2. decimal value of options.env_var
///   3. numeric suffix after the last '-' of POD_NAME, HOSTNAME or gethostname()
///      (StatefulSet ordinal, e.g. "api-3" -> 3)
///   4. last octet of the first non-loopback IPv4 interface that is up
///   5. random
/// Values wider than the requested range are masked, with a warning.
class EnvironmentHostIdResolver : public HostIdResolver {
public:
    explicit EnvironmentHostIdResolver(HostIdOptions options = {});

    ResolvedHostId Resolve(uint64_t max_host_id) const override;

private:
    std::optional<std::string> Getenv(const std::string& name) const;

    HostIdOptions options_;
};

/// "web-12" -> 12. Needs at least one '-' and a decimal last part.
std::optional<uint64_t> ParseNameSuffix(std::string_view name);

/// "10.0.3.17" -> 17
std::optional<uint64_t> ParseLastOctet(std::string_view ipv4);

/// First non-loopback IPv4 address of an interface that is up
std::optional<std::string> FindLocalIpv4();

}  // namespace suid::host
