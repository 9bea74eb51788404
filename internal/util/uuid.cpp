#include "uuid.hpp"

#include <cstdio>
#include <random>

namespace ferry::util {

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID     id{};
  uint64_t bits = 0;
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i % 8 == 0) bits = rng();
    id[i] = static_cast<uint8_t>(bits >> ((i % 8) * 8));
  }

  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | 0x40); // version 4
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80); // RFC 4122 variant
  return id;
}

std::string ToString(const UUID& id) {
  char text[37];
  std::snprintf(text, sizeof(text), "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x", id[0],
                id[1], id[2], id[3], id[4], id[5], id[6], id[7], id[8], id[9], id[10], id[11], id[12], id[13], id[14],
                id[15]);
  return text;
}

} // namespace ferry::util
