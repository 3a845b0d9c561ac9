/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   SSA/ASS script representation and Format: line schema
*/

#include "common/common_pch.h"

#include "common/fs_sys_helpers.h"
#include "common/ssa/script.h"
#include "common/strings/editing.h"

namespace umkv {
namespace ssa {

static std::string const s_utf8_bom{"\xef\xbb\xbf"};

script_c::script_c()
  : m_has_bom{}
{
}

script_cptr
script_c::parse(std::string const &content) {
  auto script = std::make_shared<script_c>();
  size_t pos  = 0;

  if (balg::starts_with(content, s_utf8_bom)) {
    script->m_has_bom = true;
    pos               = s_utf8_bom.length();
  }

  while (content.length() > pos) {
    auto eol = content.find('\n', pos);
    if (std::string::npos == eol) {
      script->m_lines.emplace_back(content.substr(pos), std::string{});
      break;
    }

    auto content_end = ((eol > pos) && (content[eol - 1] == '\r')) ? eol - 1 : eol;
    script->m_lines.emplace_back(content.substr(pos, content_end - pos), content.substr(content_end, eol + 1 - content_end));
    pos = eol + 1;
  }

  return script;
}

script_cptr
script_c::load(bfs::path const &file_name) {
  return parse(umkv::fs::read_file(file_name));
}

std::string
script_c::serialize()
  const
{
  std::string content = m_has_bom ? s_utf8_bom : std::string{};
  for (auto const &line : m_lines)
    content += line.content + line.terminator;

  return content;
}

void
script_c::save(bfs::path const &file_name)
  const
{
  umkv::fs::write_file(file_name, serialize());
}

section_e
section_for_line(std::string const &line,
                 section_e current) {
  static boost::regex s_styles_re("^\\s*\\[V4\\+?\\s+Styles\\]", boost::regex::perl | boost::regex::icase);
  static boost::regex s_events_re("^\\s*\\[Events\\]",           boost::regex::perl | boost::regex::icase);
  static boost::regex s_header_re("^\\s*\\[[^\\]]*\\]",          boost::regex::perl);

  if (boost::regex_search(line, s_styles_re))
    return section_styles;
  if (boost::regex_search(line, s_events_re))
    return section_events;
  if (boost::regex_search(line, s_header_re))
    return section_other;
  return current;
}

bool
line_has_key(std::string const &line,
             char const *key) {
  auto start = line.find_first_not_of(" \t");
  if (std::string::npos == start)
    return false;

  auto key_len = strlen(key);
  return (line.length() > (start + key_len))
      && balg::iequals(line.substr(start, key_len), key)
      && (line[start + key_len] == ':');
}

std::string
field_split_t::join()
  const
{
  return prefix + balg::join(fields, ",");
}

field_split_t
split_fields(std::string const &line,
             size_t max_fields) {
  field_split_t result;

  auto colon = line.find(':');
  if (std::string::npos == colon) {
    result.fields.push_back(line);
    return result;
  }

  auto data_start = line.find_first_not_of(" \t", colon + 1);
  if (std::string::npos == data_start)
    data_start = line.length();

  result.prefix = line.substr(0, data_start);
  result.fields = split(line.substr(data_start), ",", max_fields);

  return result;
}

static boost::optional<size_t>
find_field(std::string const &format_line,
           char const *name) {
  auto fields = split_fields(format_line).fields;
  for (auto idx = 0u; fields.size() > idx; ++idx)
    if (balg::iequals(strip_copy(fields[idx]), name))
      return idx;

  return boost::none;
}

schema_t
resolve_schema(script_c const &script) {
  schema_t schema;
  auto section          = section_none;
  auto styles_format    = false;
  auto events_format    = false;

  for (auto const &line : script.m_lines) {
    section = section_for_line(line.content, section);

    if (!line_has_key(line.content, "Format"))
      continue;

    if ((section_styles == section) && !styles_format) {
      styles_format         = true;
      schema.style_name_idx = find_field(line.content, "Name");

    } else if ((section_events == section) && !events_format) {
      events_format             = true;
      schema.dialogue_style_idx = find_field(line.content, "Style");
    }
  }

  return schema;
}

}}
