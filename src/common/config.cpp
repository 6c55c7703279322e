#include "suid/common/config.h"

#include <fstream>
#include <regex>
#include <sstream>
#include <string_view>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "suid/id/guid.h"

namespace suid {

namespace {

std::string JsonEscape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '"': out += "\\\""; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

std::optional<std::string> ExtractField(const std::string& text, std::string_view key,
                                        std::string_view value_pattern) {
    const std::string pattern = absl::StrCat("\"", key, "\"\\s*:\\s*", value_pattern);
    const std::regex re(pattern);
    std::smatch m;
    if (!std::regex_search(text, m, re) || m.size() < 2) {
        return std::nullopt;
    }
    return m[1].str();
}

std::optional<std::string> ExtractJsonStringField(const std::string& text, std::string_view key) {
    return ExtractField(text, key, "\"([^\"]*)\"");
}

std::optional<std::string> ExtractJsonIntField(const std::string& text, std::string_view key) {
    return ExtractField(text, key, "(-?[0-9]+)");
}

std::optional<bool> ExtractJsonBoolField(const std::string& text, std::string_view key) {
    auto v = ExtractField(text, key, "(true|false)");
    if (!v) {
        return std::nullopt;
    }
    return *v == "true";
}

bool HasNullField(const std::string& text, std::string_view key) {
    return ExtractField(text, key, "(null)").has_value();
}

}  // namespace

Config::Config()
    : host_env_var_("SUID_HOST_ID"),
      resolve_from_network_(true),
      default_group_(0),
      log_level_("info") {
}

Config::~Config() = default;

absl::Status Config::Load(const std::filesystem::path& config_file) {
    std::ifstream in(config_file);
    if (!in.is_open()) {
        return absl::NotFoundError(absl::StrCat("Config file not found: ", config_file.string()));
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();

    if (auto v = ExtractJsonIntField(text, "host_id")) {
        uint64_t id = 0;
        if (!absl::SimpleAtoi(*v, &id)) {
            return absl::InvalidArgumentError(absl::StrCat("Invalid host_id: ", *v));
        }
        host_id_ = id;
    } else if (HasNullField(text, "host_id")) {
        host_id_.reset();
    }
    if (auto v = ExtractJsonStringField(text, "host_env_var")) {
        host_env_var_ = *v;
    }
    if (auto v = ExtractJsonBoolField(text, "resolve_from_network")) {
        resolve_from_network_ = *v;
    }
    if (auto v = ExtractJsonIntField(text, "default_group")) {
        uint64_t group = 0;
        if (!absl::SimpleAtoi(*v, &group)) {
            return absl::InvalidArgumentError(absl::StrCat("Invalid default_group: ", *v));
        }
        if (auto status = SetDefaultGroup(group); !status.ok()) {
            return status;
        }
    }
    if (auto v = ExtractJsonStringField(text, "log_level")) {
        log_level_ = *v;
    }

    return absl::OkStatus();
}

absl::Status Config::Save(const std::filesystem::path& config_file) const {
    std::error_code ec;
    auto parent = config_file.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return absl::InternalError("Failed to create config directory");
        }
    }

    std::ofstream out(config_file, std::ios::trunc);
    if (!out.is_open()) {
        return absl::InternalError("Failed to open config file for writing");
    }

    out << "{\n";
    if (host_id_) {
        out << "  \"host_id\": " << *host_id_ << ",\n";
    } else {
        out << "  \"host_id\": null,\n";
    }
    out << "  \"host_env_var\": \"" << JsonEscape(host_env_var_) << "\",\n";
    out << "  \"resolve_from_network\": " << (resolve_from_network_ ? "true" : "false") << ",\n";
    out << "  \"default_group\": " << default_group_ << ",\n";
    out << "  \"log_level\": \"" << JsonEscape(log_level_) << "\"\n";
    out << "}\n";

    if (!out.good()) {
        return absl::InternalError("Failed to write config file");
    }
    return absl::OkStatus();
}

void Config::SetHostId(std::optional<uint64_t> host_id) {
    host_id_ = host_id;
}

std::optional<uint64_t> Config::GetHostId() const {
    return host_id_;
}

void Config::SetHostEnvVar(const std::string& name) {
    host_env_var_ = name;
}

const std::string& Config::GetHostEnvVar() const {
    return host_env_var_;
}

void Config::SetResolveFromNetwork(bool enabled) {
    resolve_from_network_ = enabled;
}

bool Config::GetResolveFromNetwork() const {
    return resolve_from_network_;
}

host::HostIdOptions Config::ToHostIdOptions() const {
    host::HostIdOptions options;
    options.host_id = host_id_;
    options.env_var = host_env_var_;
    options.use_network = resolve_from_network_;
    return options;
}

absl::Status Config::SetDefaultGroup(uint64_t group) {
    if (group > Guid::kMaxGroup) {
        return absl::InvalidArgumentError(absl::StrCat(
            "default_group ", group, " exceeds maximum ", Guid::kMaxGroup));
    }
    default_group_ = group;
    return absl::OkStatus();
}

uint64_t Config::GetDefaultGroup() const {
    return default_group_;
}

void Config::SetLogLevel(const std::string& level) {
    log_level_ = level;
}

const std::string& Config::GetLogLevel() const {
    return log_level_;
}

}  // namespace suid
