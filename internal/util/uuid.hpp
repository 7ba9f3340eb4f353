#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace phrase::util {

/*
  UUID helpers

  Phrase ids are RFC4122 v4 UUIDs carried as canonical lowercase text.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Fresh id in canonical text form.
std::string NewId();

bool IsUuidString(const std::string& str);

// Throws util::InvalidArgument naming the field when str is not a UUID.
void RequireUuid(const std::string& str, const std::string& field);

} // namespace phrase::util
