#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace artifact::util {

/*
  UUID helpers

  Raw 16 byte RFC4122 version 4 UUIDs, used for unique temp file names.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Shorthand for ToString(GenerateUUID()).
std::string RandomToken();

} // namespace artifact::util
