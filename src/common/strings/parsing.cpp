/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   string parsing helper functions
*/

#include "common/common_pch.h"

#include "common/strings/formatting.h"
#include "common/strings/parsing.h"

std::string timecode_parser_error;

static bool
timecode_error(std::string const &error) {
  timecode_parser_error = error;
  return false;
}

/** \brief Parses a timecode into nanoseconds

   Two forms are recognized: a number followed by one of the units
   's', 'ms', 'us' or 'ns', and "[HH:]MM:SS[.nnnnnnnnn]" with up to
   nine fractional digits. Minutes and seconds must be below 60.
*/
bool
parse_timecode(std::string const &src,
               int64_t &timecode,
               bool allow_negative) {
  static boost::regex s_with_unit_re("^ (\\d+) (s|ms|us|ns) $", boost::regex::perl | boost::regex::mod_x);
  static boost::regex s_clock_re("^ (?: (\\d+) : )? (\\d{1,2}) : (\\d{1,2}) (?: \\. (\\d{1,9}) )? $", boost::regex::perl | boost::regex::mod_x);

  if (src.empty())
    return timecode_error(Y("Invalid format: empty string"));

  auto negative = src[0] == '-';
  if (negative && !allow_negative)
    return timecode_error(Y("Invalid format: negative values are not allowed"));

  auto value = src.substr(negative ? 1 : 0);
  int64_t ns = 0;
  boost::smatch matches;

  if (boost::regex_match(value, matches, s_with_unit_re)) {
    auto unit        = matches[2].str();
    int64_t per_unit = unit == "s" ? 1000000000ll : unit == "ms" ? 1000000ll : unit == "us" ? 1000ll : 1ll;
    int64_t number   = 0;

    if (!parse_number(matches[1].str(), number) || (number > (std::numeric_limits<int64_t>::max() / per_unit)))
      return timecode_error(Y("Invalid format: the number is out of range"));
    ns = number * per_unit;

  } else if (boost::regex_match(value, matches, s_clock_re)) {
    int64_t hours = 0, minutes = 0, seconds = 0, fraction = 0;
    auto fraction_digits = matches[4].str();

    if (   (matches[1].matched && !parse_number(matches[1].str(), hours))
        || !parse_number(matches[2].str(), minutes)
        || !parse_number(matches[3].str(), seconds)
        || (!fraction_digits.empty() && !parse_number(fraction_digits + std::string(9 - fraction_digits.length(), '0'), fraction)))
      return timecode_error(Y("Invalid format: a number is out of range"));

    // The largest hour count for which the total still fits.
    static int64_t const s_max_hours = (std::numeric_limits<int64_t>::max() - 3599999999999ll) / 3600000000000ll;

    if (hours > s_max_hours)
      return timecode_error((boost::format(Y("Invalid number of hours: %1% > %2%")) % hours % s_max_hours).str());
    if (minutes > 59)
      return timecode_error((boost::format(Y("Invalid number of minutes: %1% > 59")) % minutes).str());
    if (seconds > 59)
      return timecode_error((boost::format(Y("Invalid number of seconds: %1% > 59")) % seconds).str());

    ns = (hours * 3600 + minutes * 60 + seconds) * 1000000000ll + fraction;

  } else
    return timecode_error(Y("Invalid format: expected '[HH:]MM:SS[.nnnnnnnnn]' or a number followed by 's', 'ms', 'us' or 'ns'"));

  timecode              = negative ? -ns : ns;
  timecode_parser_error = Y("no error");

  return true;
}

bool
parse_timecode(std::string const &src,
               timecode_c &timecode,
               bool allow_negative) {
  int64_t ns = 0;
  auto ok    = parse_timecode(src, ns, allow_negative);
  if (ok)
    timecode = timecode_c::ns(ns);
  return ok;
}

bool
parse_bool(std::string const &value) {
  static std::map<std::string, bool> const s_words{
    { "yes", true  }, { "true",  true  }, { "on",  true  }, { "1", true  },
    { "no",  false }, { "false", false }, { "off", false }, { "0", false },
  };

  auto word = s_words.find(balg::to_lower_copy(strip_copy(value)));
  if (word == s_words.end())
    throw umkv::invalid_parameter_x{};

  return word->second;
}
