/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   definitions for helper functions for unit tests
*/

#ifndef UMKV_TESTS_UNIT_UTIL_H
#define UMKV_TESTS_UNIT_UTIL_H

#include "common/common_pch.h"

namespace umkvut {

// A fresh directory below the system's temporary directory that is
// removed again when the object goes out of scope.
class temp_dir_c {
protected:
  bfs::path m_path;

public:
  temp_dir_c();
  ~temp_dir_c();

  bfs::path const &path() const {
    return m_path;
  }
  bfs::path operator /(std::string const &name) const {
    return m_path / name;
  }

  // Creates the file (and missing parent directories).
  bfs::path touch(std::string const &name, std::string const &content = std::string{}) const;
};

bfs::path data_dir();
std::string read_data_file(std::string const &name);

struct chapter_spec_t {
  std::string start, end, segment_uid;
  bool enabled;

  chapter_spec_t(std::string const &p_start, std::string const &p_end, std::string const &p_segment_uid = std::string{}, bool p_enabled = true)
    : start{p_start}
    , end{p_end}
    , segment_uid{p_segment_uid}
    , enabled{p_enabled}
  {
  }
};

// Builds an ordered single edition chapter XML document.
std::string build_chapters_xml(std::vector<chapter_spec_t> const &chapters);

}

#endif // UMKV_TESTS_UNIT_UTIL_H
