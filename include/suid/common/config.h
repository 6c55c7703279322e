#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <absl/status/status.h>

#include "suid/host/host_id.h"

namespace suid {

/// Settings for the identifier tools, stored as a flat JSON object:
///   {
///     "host_id": 12,
///     "host_env_var": "SUID_HOST_ID",
///     "resolve_from_network": true,
///     "default_group": 0,
///     "log_level": "info"
///   }
/// Missing keys keep their defaults.
class Config {
public:
    Config();
    ~Config();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) = delete;
    Config& operator=(Config&&) = delete;

    absl::Status Load(const std::filesystem::path& config_file);
    absl::Status Save(const std::filesystem::path& config_file) const;

    // Host id resolution
    void SetHostId(std::optional<uint64_t> host_id);
    std::optional<uint64_t> GetHostId() const;

    void SetHostEnvVar(const std::string& name);
    const std::string& GetHostEnvVar() const;

    void SetResolveFromNetwork(bool enabled);
    bool GetResolveFromNetwork() const;

    host::HostIdOptions ToHostIdOptions() const;

    // GUID group used when none is given
    absl::Status SetDefaultGroup(uint64_t group);
    uint64_t GetDefaultGroup() const;

    // Logging
    void SetLogLevel(const std::string& level);
    const std::string& GetLogLevel() const;

private:
    std::optional<uint64_t> host_id_;
    std::string host_env_var_;
    bool resolve_from_network_;
    uint64_t default_group_;
    std::string log_level_;
};

}  // namespace suid
