/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   string formatting functions
*/

#include "common/common_pch.h"

#include <boost/lexical_cast.hpp>

#include "common/strings/formatting.h"

std::string
format_timecode(int64_t ns,
                unsigned int precision) {
  auto seconds = ns / 1000000000;
  auto result  = (boost::format("%|1$02d|:%|2$02d|:%|3$02d|") % (seconds / 3600) % ((seconds / 60) % 60) % (seconds % 60)).str();

  precision = std::min(precision, 9u);
  if (precision)
    result += "." + (boost::format("%|1$09d|") % (ns % 1000000000)).str().substr(0, precision);

  return result;
}

std::string
format_paragraph(std::string const &text,
                 int indent_column,
                 std::string const &first_line_prefix,
                 int wrap_column) {
  auto indent    = std::string(indent_column, ' ');
  auto paragraph = first_line_prefix;

  if ((0 != indent_column) && (static_cast<int>(paragraph.length()) >= indent_column))
    paragraph += "\n";

  auto line_start = paragraph.rfind('\n');
  auto column     = [&]() { return static_cast<int>(paragraph.length() - (std::string::npos == line_start ? 0 : line_start + 1)); };

  paragraph      += std::string(std::max(indent_column - column(), 0), ' ');
  auto line_empty = true;

  std::vector<std::string> words;
  balg::split(words, text, balg::is_any_of(" "), balg::token_compress_on);

  for (auto const &word : words) {
    if (word.empty())
      continue;

    if (!line_empty && ((column() + 1 + static_cast<int>(word.length())) >= wrap_column)) {
      paragraph  += "\n" + indent;
      line_start  = paragraph.rfind('\n');
      line_empty  = true;
    }

    paragraph  += (line_empty ? "" : " ") + word;
    line_empty  = false;
  }

  return paragraph + "\n";
}

std::string
to_string(int64_t value) {
  return boost::lexical_cast<std::string>(value);
}

std::string
to_hex(unsigned char const *buf,
       size_t size,
       bool compact) {
  std::vector<std::string> bytes;
  for (auto idx = 0u; idx < size; ++idx)
    bytes.push_back((boost::format(compact ? "%|1$02x|" : "0x%|1$02x|") % static_cast<unsigned int>(buf[idx])).str());

  return balg::join(bytes, compact ? "" : " ");
}
