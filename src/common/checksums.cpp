/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   checksum calculations
*/

#include "common/common_pch.h"

#include <zlib.h>

#include "common/checksums.h"

// Standard CRC-32 (IEEE 802.3 polynomial) as computed by zlib.
uint32_t
calc_crc32(const unsigned char *buffer,
           size_t size) {
  uLong crc = crc32(0L, Z_NULL, 0);

  while (size) {
    auto chunk = static_cast<uInt>(std::min<size_t>(size, std::numeric_limits<uInt>::max()));
    crc        = crc32(crc, buffer, chunk);
    buffer    += chunk;
    size      -= chunk;
  }

  return static_cast<uint32_t>(crc);
}
