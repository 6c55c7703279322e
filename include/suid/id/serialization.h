#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

#include "suid/id/guid.h"
#include "suid/id/suid.h"

namespace suid {

// JSON: both kinds travel as their text form in double quotes.
std::string ToJson(const Suid& id);
std::string ToJson(const Guid& id);
absl::StatusOr<Suid> SuidFromJson(std::string_view json);
absl::StatusOr<Guid> GuidFromJson(std::string_view json);

// SQL storage: SUID as a native 64-bit integer, GUID as fixed-width text.
inline constexpr std::string_view kSuidSqlType = "BIGINT";
inline constexpr std::string_view kGuidSqlType = "CHAR(16)";

int64_t ToSqlValue(const Suid& id);
std::string ToSqlValue(const Guid& id);

/// Rejects negative values, which no suid.v1 SUID can have
absl::StatusOr<Suid> SuidFromSqlValue(int64_t value);
absl::StatusOr<Guid> GuidFromSqlValue(std::string_view value);

}  // namespace suid
