/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   SSA/ASS script representation and Format: line schema
*/

#ifndef UMKV_COMMON_SSA_SCRIPT_H
#define UMKV_COMMON_SSA_SCRIPT_H

#include "common/common_pch.h"

namespace umkv {
namespace ssa {

enum section_e {
  section_none,
  section_styles,
  section_events,
  section_other,
};

struct line_t {
  std::string content, terminator;

  line_t(std::string const &p_content, std::string const &p_terminator)
    : content{p_content}
    , terminator{p_terminator}
  {
  }
};

// A script kept line by line, each line with its own terminator, so
// that unmodified files are written back byte for byte.
class script_c;
typedef std::shared_ptr<script_c> script_cptr;

class script_c {
public:
  std::vector<line_t> m_lines;

protected:
  bool m_has_bom;

public:
  script_c();

  bool has_bom() const {
    return m_has_bom;
  }

  std::string serialize() const;
  void save(bfs::path const &file_name) const;

  static script_cptr parse(std::string const &content);
  static script_cptr load(bfs::path const &file_name);
};

// Returns the section started by a header line, or the current section
// if the line is not a header.
section_e section_for_line(std::string const &line, section_e current);

// Returns true for lines starting with the given key followed by a
// colon, e.g. "Style:"; leading whitespace is ignored.
bool line_has_key(std::string const &line, char const *key);

struct field_split_t {
  std::string prefix;
  std::vector<std::string> fields;

  std::string join() const;
};

// Splits a "Key: a,b,c" line into the prefix "Key: " (including the
// whitespace after the colon) and at most max_fields fields. The last
// field receives the rest of the line including any further commas.
field_split_t split_fields(std::string const &line, size_t max_fields = 0);

struct schema_t {
  boost::optional<size_t> style_name_idx, dialogue_style_idx;

  bool is_complete() const {
    return style_name_idx && dialogue_style_idx;
  }
};

schema_t resolve_schema(script_c const &script);

}}

#endif  // UMKV_COMMON_SSA_SCRIPT_H
