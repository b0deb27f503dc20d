/*
 * byteorder.h - Byte order selection and LE/BE integer types
 *
 * Home page of code is: https://www.smartmontools.org
 *
 * Copyright (C) 2025 Christian Franke
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef SMARTATTR_BYTEORDER_H
#define SMARTATTR_BYTEORDER_H

#include <smartattr/smartattr_defs.h>

#include <stdint.h>

namespace smartattr {

/// Byte order of the multi-byte fields in a data buffer.
enum byte_order
{
  BYTEORDER_LE, // Little endian (ATA, NVMe)
  BYTEORDER_BE  // Big endian
};

/// Byte order of the host as determined at build time.
/// Verified at runtime by check_config().
constexpr byte_order host_byte_order()
{
#ifdef SMARTATTR_WORDS_BIGENDIAN
  return BYTEORDER_BE;
#else
  return BYTEORDER_LE;
#endif
}

/// Name of byte order for messages.
inline const char * byte_order_name(byte_order order)
  { return (order == BYTEORDER_BE ? "big endian" : "little endian"); }

// Unaligned Little Endian unsigned integers
struct uile16_t { uint8_t b[2]; };
struct uile32_t { uint8_t b[4]; };

// uile*_t -> uint*_t

constexpr uint16_t uile16_to_uint(uile16_t x)
{
  return (x.b[1] << 8) | x.b[0];
}

constexpr uint32_t uile32_to_uint(uile32_t x)
{
  return   ((uint32_t)x.b[3] << 24) | ((uint32_t)x.b[2] << 16)
         | ((uint32_t)x.b[1] <<  8) |  (uint32_t)x.b[0]       ;
}

// uint*_t -> uile*_t

constexpr uile16_t uint_to_uile16(uint16_t x)
{
  return uile16_t{{(uint8_t)x, (uint8_t)(x >> 8)}};
}

constexpr uile32_t uint_to_uile32(uint32_t x)
{
  return uile32_t{{(uint8_t) x       , (uint8_t)(x >>  8),
                   (uint8_t)(x >> 16), (uint8_t)(x >> 24) }};
}

// Get 64-bit value from unaligned 8-byte LE buffer.
inline uint64_t get_uint64_le(const unsigned char * p)
{
  uint64_t x = 0;
  for (int i = 8 - 1; i >= 0; i--) {
    x <<= 8; x |= p[i];
  }
  return x;
}

// Compile-time checks
SMARTATTR_STATIC_ASSERT(uile16_to_uint(uile16_t{{0x34,0x12}}) == 0x1234);
SMARTATTR_STATIC_ASSERT(uile16_to_uint(uint_to_uile16(0x1234)) == 0x1234);
SMARTATTR_STATIC_ASSERT(uile32_to_uint(uile32_t{{0x78,0x56,0x34,0x12}}) == 0x12345678);
SMARTATTR_STATIC_ASSERT(uile32_to_uint(uint_to_uile32(0x12345678)) == 0x12345678);

} // namespace smartattr

#endif // SMARTATTR_BYTEORDER_H
