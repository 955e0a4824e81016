#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace chessdb::util {

/*
  UUID helpers

  Player identities are random RFC4122 v4 UUIDs kept in string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Convenience: GenerateUUID() rendered as a string.
std::string NewId();

} // namespace chessdb::util
