#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace ferry::util {

/*
  Random (version 4) UUIDs. Temporary documents carry one in their file
  name so concurrent transfers never share a path.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// Canonical 8-4-4-4-12 lowercase form.
std::string ToString(const UUID& id);

} // namespace ferry::util
