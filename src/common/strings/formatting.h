/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   string formatting functions
*/

#ifndef UMKV_COMMON_STRINGS_FORMATTING_H
#define UMKV_COMMON_STRINGS_FORMATTING_H

#include "common/common_pch.h"

#include <ostream>
#include <sstream>

#include "common/strings/editing.h"
#include "common/timecode.h"

#define WRAP_AT_COLUMN 79

// HH:MM:SS followed by 'precision' fractional digits (at most nine).
// The hours are not limited to two digits.
std::string format_timecode(int64_t ns, unsigned int precision = 9);

template<typename T>
std::string
format_timecode(basic_timecode_c<T> const &timecode,
                unsigned int precision = 9) {
  return format_timecode(timecode.to_ns(), precision);
}

template<typename T>
std::ostream &
operator <<(std::ostream &out,
            basic_timecode_c<T> const &timecode) {
  return out << (timecode.valid() ? format_timecode(timecode) : std::string{"<InvTC>"});
}

// Word wraps 'text' at 'wrap_column'. The first line starts with
// 'first_line_prefix'; the text itself starts at 'indent_column' on
// every line, on a new line if the prefix reaches that column.
std::string format_paragraph(std::string const &text,
                             int indent_column                    = 0,
                             std::string const &first_line_prefix = empty_string,
                             int wrap_column                      = WRAP_AT_COLUMN);

inline std::string
to_string(std::string const &value) {
  return value;
}

std::string to_string(int64_t value);

template<typename T>
std::string
to_string(basic_timecode_c<T> const &timecode) {
  return format_timecode(timecode.to_ns());
}

// "0x01 0xab" or, compact, "01ab".
std::string to_hex(unsigned char const *buf, size_t size, bool compact = false);
inline std::string
to_hex(std::string const &buf,
       bool compact = false) {
  return to_hex(reinterpret_cast<unsigned char const *>(buf.data()), buf.length(), compact);
}

#endif  // UMKV_COMMON_STRINGS_FORMATTING_H
