/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   program version and version numbers reported by other programs
*/

#include "common/common_pch.h"

#include "common/strings/formatting.h"
#include "common/strings/parsing.h"
#include "common/version.h"

static debugging_option_c s_debug{"version"};

version_number_t::version_number_t()
  : valid(false)
{
}

version_number_t::version_number_t(std::string const &s)
  : valid(false)
{
  static boost::regex s_version_re("(?: ^ | \\s v) (\\d+ (?: \\. \\d+){1,3}) (?: \\s | \\z)",
                                   boost::regex::perl | boost::regex::mod_x | boost::regex::icase);

  boost::smatch matches;
  if (!boost::regex_search(s, matches, s_version_re)) {
    mxdebug_if(s_debug, boost::format("no version number in '%1%'\n") % s);
    return;
  }

  auto version = matches[1].str();
  std::vector<std::string> numbers;
  balg::split(numbers, version, balg::is_any_of("."));

  for (auto const &number : numbers) {
    unsigned int value = 0;
    if (!parse_number(number, value)) {
      parts.clear();
      return;
    }
    parts.push_back(value);
  }

  valid = true;

  mxdebug_if(s_debug, boost::format("version number %1% in '%2%'\n") % to_string() % s);
}

int
version_number_t::compare(version_number_t const &cmp)
  const {
  auto num_parts = std::max(parts.size(), cmp.parts.size());

  for (auto idx = 0u; num_parts > idx; ++idx) {
    auto mine   = idx < parts.size()     ? parts[idx]     : 0u;
    auto theirs = idx < cmp.parts.size() ? cmp.parts[idx] : 0u;

    if (mine != theirs)
      return mine < theirs ? -1 : 1;
  }

  return 0;
}

bool
version_number_t::operator <(version_number_t const &cmp)
  const {
  return compare(cmp) < 0;
}

std::string
version_number_t::to_string()
  const {
  if (!valid)
    return "<invalid>";

  std::vector<std::string> numbers;
  for (auto part : parts)
    numbers.push_back(::to_string(part));

  return balg::join(numbers, ".");
}

std::string
get_version_info(std::string const &program,
                 bool with_build_date) {
  auto info = (boost::format("%1% v%2%") % program % UMKV_VERSION).str();
  if (!with_build_date)
    return info;

  return (boost::format(Y("%1% built on %2% %3%")) % info % __DATE__ % __TIME__).str();
}
