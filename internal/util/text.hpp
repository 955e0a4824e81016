#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace chessdb::util {

std::string Trim(std::string_view value);

// Natural key for player names: trimmed, internal whitespace runs collapsed
// to one space, ASCII lowercased. "  Magnus   CARLSEN " -> "magnus carlsen".
std::string NormalizeName(std::string_view name);

// Trimmed display form with whitespace runs collapsed, case preserved.
std::string CollapseWhitespace(std::string_view value);

std::string ToUpperAscii(std::string_view value);

// 64-bit FNV-1a; stable across platforms and runs.
class Fnv1a {
 public:
  void     Update(std::string_view bytes);
  uint64_t Digest() const {
    return hash_;
  }

 private:
  uint64_t hash_ = 0xcbf29ce484222325ULL;
};

std::string ToHex(uint64_t value);

} // namespace chessdb::util
