#include "wasp/Util.h"
#include <array>
#include <chrono>
#include <mutex>
#include <random>

namespace wasp {

uint64_t fnv1a64(const uint8_t* data, size_t len) {
  const uint64_t fnv_offset = 1469598103934665603ull;
  const uint64_t fnv_prime = 1099511628211ull;
  uint64_t hash = fnv_offset;
  for (size_t i = 0; i < len; ++i) {
    hash ^= static_cast<uint64_t>(data[i]);
    hash *= fnv_prime;
  }
  return hash;
}

TimeMs wall_clock_ms() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<TimeMs>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

std::string make_opaque_id() {
  static std::mutex mu;
  static std::mt19937_64 rng{std::random_device{}()};
  std::array<uint8_t, 16> b{};
  {
    std::lock_guard<std::mutex> lock(mu);
    uint64_t hi = rng();
    uint64_t lo = rng();
    for (size_t i = 0; i < 8; ++i) {
      b[i] = static_cast<uint8_t>(hi >> (56 - 8 * i));
      b[8 + i] = static_cast<uint8_t>(lo >> (56 - 8 * i));
    }
  }
  b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);
  b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);

  static const char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < b.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[b[i] >> 4]);
    out.push_back(kHex[b[i] & 0x0F]);
  }
  return out;
}

const char* to_string(Action a) {
  switch (a) {
    case Action::Allow: return "allow";
    case Action::Challenge: return "challenge";
    case Action::Tarpit: return "tarpit";
    case Action::Block: return "block";
  }
  return "allow";
}

std::optional<Action> parse_action(std::string_view text) {
  if (text == "allow") return Action::Allow;
  if (text == "challenge") return Action::Challenge;
  if (text == "tarpit") return Action::Tarpit;
  if (text == "block") return Action::Block;
  return std::nullopt;
}

const char* to_string(StoreStatus s) {
  switch (s) {
    case StoreStatus::Ok: return "ok";
    case StoreStatus::NotFound: return "not_found";
    case StoreStatus::Unavailable: return "unavailable";
    case StoreStatus::Invalid: return "invalid";
  }
  return "?";
}

std::string IdentityKey::str() const {
  return ip + ":" + std::to_string(asn);
}

std::string case_key(std::string_view zone, std::string_view ip, Asn asn) {
  std::string key;
  key.reserve(zone.size() + ip.size() + 12);
  key.append(zone);
  key.push_back(':');
  key.append(ip);
  key.push_back(':');
  key.append(std::to_string(asn));
  return key;
}

} // namespace wasp
