/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   program version and version numbers reported by other programs
*/

#ifndef UMKV_COMMON_VERSION_H
#define UMKV_COMMON_VERSION_H

#include "common/common_pch.h"

#if !defined(UMKV_VERSION)
# define UMKV_VERSION "1.0.0"
#endif

// A version number with two to four numeric components, e.g. "82.0"
// or "8.9.0". Missing components compare as zero.
struct version_number_t {
  std::vector<unsigned int> parts;
  bool valid;

  version_number_t();
  // Finds the first version number in 's', optionally preceded by the
  // program name and 'v' as in "mkvmerge v82.0 ('I'm The Drifter') 64-bit".
  explicit version_number_t(std::string const &s);

  bool operator <(version_number_t const &cmp) const;
  int compare(version_number_t const &cmp) const;

  std::string to_string() const;
};

// "unlinkmkv v1.0.0"; with 'with_build_date' the build date and time
// are appended.
std::string get_version_info(std::string const &program, bool with_build_date = false);

#endif  // UMKV_COMMON_VERSION_H
