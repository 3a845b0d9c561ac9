/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   definitions for string parsing functions
*/

#ifndef UMKV_COMMON_STRING_PARSING_H
#define UMKV_COMMON_STRING_PARSING_H

#include "common/common_pch.h"

#include <type_traits>

#include <boost/lexical_cast.hpp>

#include "common/timecode.h"

// Converts the whole of 'string'. Negative numbers are rejected for
// unsigned types instead of wrapping around.
template<typename ValueT>
bool
parse_number(std::string const &string,
             ValueT &value) {
  if (std::is_unsigned<ValueT>::value && !string.empty() && (string[0] == '-'))
    return false;

  try {
    value = boost::lexical_cast<ValueT>(string);
    return true;
  } catch (boost::bad_lexical_cast &) {
    return false;
  }
}

// Set to the reason of the last parse_timecode() failure.
extern std::string timecode_parser_error;
bool parse_timecode(std::string const &s, int64_t &timecode, bool allow_negative = false);
bool parse_timecode(std::string const &s, timecode_c &timecode, bool allow_negative = false);

// "yes", "true", "on", "1" and "no", "false", "off", "0", ignoring case
// and surrounding blanks. Throws umkv::invalid_parameter_x otherwise.
bool parse_bool(std::string const &value);

#endif  // UMKV_COMMON_STRING_PARSING_H
