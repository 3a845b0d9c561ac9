/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   string splitting and whitespace removal
*/

#include "common/common_pch.h"

#include "common/strings/editing.h"

std::string const empty_string;

std::vector<std::string>
split(std::string const &text,
      std::string const &separator,
      size_t max) {
  std::vector<std::string> parts;
  size_t start = 0;

  while ((0 == max) || ((parts.size() + 1) < max)) {
    auto pos = text.find(separator, start);
    if (std::string::npos == pos)
      break;

    parts.push_back(text.substr(start, pos - start));
    start = pos + separator.length();
  }

  parts.push_back(text.substr(start));

  return parts;
}

static std::function<bool(char)>
whitespace(bool newlines) {
  return [newlines](char c) {
    return isblanktab(c) || (newlines && iscr(c));
  };
}

void
strip_back(std::string &s,
           bool newlines) {
  balg::trim_right_if(s, whitespace(newlines));
}

void
strip(std::string &s,
      bool newlines) {
  balg::trim_if(s, whitespace(newlines));
}

std::string
strip_copy(std::string const &s,
           bool newlines) {
  return balg::trim_copy_if(s, whitespace(newlines));
}
