// Copyright (c) 2014-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace dropnet {
namespace endian {

// Little-endian load/store helpers for the wire codec. All scalar fields on
// the wire are little-endian regardless of host byte order.

inline uint16_t byteswap16(uint16_t x) { return static_cast<uint16_t>((x >> 8) | (x << 8)); }

inline uint32_t byteswap32(uint32_t x) {
  return ((x >> 24) & 0x000000FF) | ((x >> 8) & 0x0000FF00) |
         ((x << 8) & 0x00FF0000) | ((x << 24) & 0xFF000000);
}

inline uint64_t byteswap64(uint64_t x) {
  return (static_cast<uint64_t>(byteswap32(static_cast<uint32_t>(x))) << 32) |
         byteswap32(static_cast<uint32_t>(x >> 32));
}

template <typename T, T (*Swap)(T)>
inline T ReadLE(const uint8_t *ptr) {
  T result;
  std::memcpy(&result, ptr, sizeof(result));
  if constexpr (std::endian::native == std::endian::big) {
    result = Swap(result);
  }
  return result;
}

template <typename T, T (*Swap)(T)>
inline void WriteLE(uint8_t *ptr, T value) {
  if constexpr (std::endian::native == std::endian::big) {
    value = Swap(value);
  }
  std::memcpy(ptr, &value, sizeof(value));
}

inline uint16_t ReadLE16(const uint8_t *ptr) { return ReadLE<uint16_t, byteswap16>(ptr); }
inline uint32_t ReadLE32(const uint8_t *ptr) { return ReadLE<uint32_t, byteswap32>(ptr); }
inline uint64_t ReadLE64(const uint8_t *ptr) { return ReadLE<uint64_t, byteswap64>(ptr); }

inline void WriteLE16(uint8_t *ptr, uint16_t value) { WriteLE<uint16_t, byteswap16>(ptr, value); }
inline void WriteLE32(uint8_t *ptr, uint32_t value) { WriteLE<uint32_t, byteswap32>(ptr, value); }
inline void WriteLE64(uint8_t *ptr, uint64_t value) { WriteLE<uint64_t, byteswap64>(ptr, value); }

} // namespace endian
} // namespace dropnet
