#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include "Common.h"

namespace wasp {

uint64_t fnv1a64(const uint8_t* data, size_t len);

inline uint64_t fnv1a64(std::string_view s) {
  return fnv1a64(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

inline bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Milliseconds since the Unix epoch.
TimeMs wall_clock_ms();

// Random RFC 4122 version 4 identifier, lowercase hex with dashes.
std::string make_opaque_id();

} // namespace wasp
