#include "suid/id/serialization.h"

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

namespace suid {

namespace {

absl::StatusOr<std::string_view> Unquote(std::string_view json, size_t text_length) {
    if (json.size() != text_length + 2 || json.front() != '"' || json.back() != '"') {
        return absl::InvalidArgumentError(absl::StrCat(
            "Expected a quoted string of ", text_length, " characters, got ", json.size(), " bytes"));
    }
    return json.substr(1, text_length);
}

}  // namespace

std::string ToJson(const Suid& id) {
    return absl::StrCat("\"", id.ToText(), "\"");
}

std::string ToJson(const Guid& id) {
    return absl::StrCat("\"", id.ToText(), "\"");
}

absl::StatusOr<Suid> SuidFromJson(std::string_view json) {
    auto text = Unquote(json, Suid::kTextLength);
    if (!text.ok()) {
        return absl::InvalidArgumentError(absl::StrCat("Invalid SUID JSON: ", text.status().message()));
    }
    return Suid::FromText(*text);
}

absl::StatusOr<Guid> GuidFromJson(std::string_view json) {
    auto text = Unquote(json, Guid::kTextLength);
    if (!text.ok()) {
        return absl::InvalidArgumentError(absl::StrCat("Invalid GUID JSON: ", text.status().message()));
    }
    return Guid::FromText(*text);
}

int64_t ToSqlValue(const Suid& id) {
    return id.ToRaw();
}

std::string ToSqlValue(const Guid& id) {
    return id.ToText();
}

absl::StatusOr<Suid> SuidFromSqlValue(int64_t value) {
    if (value < 0) {
        return absl::InvalidArgumentError(absl::StrCat("Negative SUID column value: ", value));
    }
    return Suid::FromRaw(value);
}

absl::StatusOr<Guid> GuidFromSqlValue(std::string_view value) {
    return Guid::FromText(value);
}

}  // namespace suid
