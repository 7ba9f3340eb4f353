#include "uuid.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

#include "errors.hpp"

namespace phrase::util {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

UUID FromString(const std::string& str) {
  if (!IsUuidString(str)) throw std::invalid_argument("Invalid UUID string: " + str);

  std::string hex;
  for (char c : str)
    if (c != '-') hex += c;

  UUID id{};
  for (size_t i = 0; i < 16; ++i)
    id[i] = static_cast<uint8_t>((HexNibble(hex[i * 2]) << 4) | HexNibble(hex[i * 2 + 1]));

  return id;
}

std::string NewId() {
  return ToString(GenerateUUID());
}

bool IsUuidString(const std::string& str) {
  if (str.size() != 36) return false;
  for (size_t i = 0; i < str.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (str[i] != '-') return false;
    } else if (HexNibble(str[i]) < 0) {
      return false;
    }
  }
  return true;
}

void RequireUuid(const std::string& str, const std::string& field) {
  if (str.empty()) throw InvalidArgument(field + " is required");
  if (!IsUuidString(str)) throw InvalidArgument(field + " is not a valid id: " + str);
}

} // namespace phrase::util
