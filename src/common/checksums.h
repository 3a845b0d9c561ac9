/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   checksum calculations
*/

#ifndef UMKV_COMMON_CHECKSUMS_H
#define UMKV_COMMON_CHECKSUMS_H

#include "common/common_pch.h"

uint32_t calc_crc32(const unsigned char *buffer, size_t size);

inline uint32_t
calc_crc32(std::string const &buffer) {
  return calc_crc32(reinterpret_cast<const unsigned char *>(buffer.data()), buffer.size());
}

#endif // UMKV_COMMON_CHECKSUMS_H
