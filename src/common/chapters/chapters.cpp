/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   chapter model on top of the Matroska chapter XML format
*/

#include "common/common_pch.h"

#include "common/chapters/chapters.h"
#include "common/fs_sys_helpers.h"
#include "common/strings/editing.h"
#include "common/strings/formatting.h"
#include "common/strings/parsing.h"

namespace umkv {
namespace chapters {

static debugging_option_c s_debug{"chapters"};

segment_uid_c::segment_uid_c(std::string const &id,
                             uid_format_e format)
  : m_id(id)
  , m_format(format)
{
}

std::string
segment_uid_c::normalize(std::string const &content,
                         uid_format_e format) {
  if (uf_ascii == format)
    return to_hex(content, true);

  // Hex content may be written as "0x12 0x34 ..." or as a plain run of
  // digits spread over several lines.
  auto id = boost::regex_replace(content, boost::regex{"(0x|\\s)+", boost::regex::perl | boost::regex::icase}, "");
  balg::to_lower(id);

  return id;
}

segment_uid_c
segment_uid_c::from_xml(std::string const &content,
                        std::string const &format_attribute) {
  auto format = balg::iequals(format_attribute, "ascii") ? uf_ascii : uf_hex;
  auto id     = normalize(strip_copy(content, true), format);

  if (id.empty())
    throw malformed_chapters_x{Y("A chapter segment UID is empty.")};

  if ((uf_hex == format) && boost::regex_search(id, boost::regex{"[^0-9a-f]", boost::regex::perl}))
    throw malformed_chapters_x{boost::format(Y("The chapter segment UID '%1%' contains non-hex digits.")) % strip_copy(content, true)};

  return segment_uid_c{id, format};
}

std::ostream &
operator <<(std::ostream &out,
            segment_uid_c const &uid) {
  out << uid.get_id();
  return out;
}

// ------------------------------------------------------------

chapter_entry_c::chapter_entry_c(pugi::xml_node node,
                                 timecode_c start,
                                 timecode_c end,
                                 bool enabled,
                                 boost::optional<segment_uid_c> const &segment_uid)
  : m_node(node)
  , m_start(start)
  , m_end(end)
  , m_enabled(enabled)
  , m_segment_uid(segment_uid)
{
}

std::string
chapter_entry_c::get_name()
  const
{
  return m_node.child("ChapterDisplay").child_value("ChapterString");
}

void
chapter_entry_c::set_start(timecode_c const &start) {
  m_start = start;
  m_node.child("ChapterTimeStart").text().set(format_timecode(start).c_str());
}

void
chapter_entry_c::set_end(timecode_c const &end) {
  m_end = end;
  m_node.child("ChapterTimeEnd").text().set(format_timecode(end).c_str());
}

void
chapter_entry_c::drop_segment_uid() {
  xml::remove_children(m_node, "ChapterSegmentUID");
}

// ------------------------------------------------------------

static timecode_c
parse_chapter_timecode(pugi::xml_node atom,
                       char const *name) {
  auto content = strip_copy(atom.child_value(name), true);
  timecode_c timecode;

  if (!parse_timecode(content, timecode))
    throw malformed_chapters_x{boost::format(Y("The content '%1%' of <%2%> is not a valid timecode: %3%")) % content % name % timecode_parser_error};

  return timecode;
}

chapters_c::chapters_c(xml::document_cptr const &doc)
  : m_doc(doc)
{
  if (!root())
    throw malformed_chapters_x{Y("The chapter XML does not contain a <Chapters> root element.")};
}

chapters_cptr
chapters_c::parse(std::string const &content) {
  try {
    return std::make_shared<chapters_c>(xml::load_string(content));

  } catch (xml::xml_parser_x &ex) {
    throw malformed_chapters_x{ex.error()};
  }
}

chapters_cptr
chapters_c::load(bfs::path const &file_name) {
  return parse(umkv::fs::read_file(file_name));
}

pugi::xml_node
chapters_c::root()
  const
{
  return m_doc->child("Chapters");
}

std::vector<pugi::xml_node>
chapters_c::editions()
  const
{
  std::vector<pugi::xml_node> editions;
  for (auto edition = root().child("EditionEntry"); edition; edition = edition.next_sibling("EditionEntry"))
    editions.push_back(edition);

  return editions;
}

size_t
chapters_c::num_editions()
  const
{
  return editions().size();
}

chapter_entries_t
chapters_c::get_entries(size_t edition)
  const
{
  auto all_editions = editions();
  if ((0 == edition) || (edition > all_editions.size()))
    throw no_such_edition_x{edition, all_editions.size()};

  chapter_entries_t entries;
  auto idx = 0u;

  for (auto atom = all_editions[edition - 1].child("ChapterAtom"); atom; atom = atom.next_sibling("ChapterAtom")) {
    ++idx;

    if (!atom.child("ChapterTimeStart") || !atom.child("ChapterTimeEnd")) {
      mxdebug_if(s_debug, boost::format("chapter atom %1% lacks a start or an end; left untouched\n") % idx);
      continue;
    }

    auto start   = parse_chapter_timecode(atom, "ChapterTimeStart");
    auto end     = parse_chapter_timecode(atom, "ChapterTimeEnd");
    auto enabled = true;

    if (atom.child("ChapterFlagEnabled")) {
      auto flag = strip_copy(atom.child_value("ChapterFlagEnabled"), true);
      try {
        enabled = parse_bool(flag);
      } catch (umkv::invalid_parameter_x &) {
        throw malformed_chapters_x{boost::format(Y("The content '%1%' of <ChapterFlagEnabled> is not a valid flag.")) % flag};
      }
    }

    boost::optional<segment_uid_c> segment_uid;
    auto uid_node = atom.child("ChapterSegmentUID");
    if (uid_node)
      segment_uid = segment_uid_c::from_xml(uid_node.child_value(), uid_node.attribute("format").as_string("hex"));

    entries.push_back(chapter_entry_c{atom, start, end, enabled, segment_uid});
  }

  return entries;
}

void
chapters_c::select_edition(size_t edition) {
  auto all_editions = editions();
  if ((0 == edition) || (edition > all_editions.size()))
    throw no_such_edition_x{edition, all_editions.size()};

  auto chapters_root = root();
  for (auto idx = 0u; all_editions.size() > idx; ++idx)
    if ((idx + 1) != edition)
      chapters_root.remove_child(all_editions[idx]);
}

size_t
chapters_c::drop_non_default_editions() {
  auto chapters_root = root();
  size_t num_dropped = 0;

  for (auto &edition : editions()) {
    auto flag = edition.child("EditionFlagDefault");
    if (!flag || (strip_copy(flag.child_value(), true) != "0"))
      continue;

    chapters_root.remove_child(edition);
    ++num_dropped;
  }

  return num_dropped;
}

void
chapters_c::clear_ordered_flag() {
  for (auto &edition : editions())
    xml::remove_children(edition, "EditionFlagOrdered");
}

bool
chapters_c::has_segment_links()
  const
{
  return !!m_doc->find_node([](pugi::xml_node const &node) {
    return std::string{"ChapterSegmentUID"} == node.name();
  });
}

std::string
chapters_c::serialize()
  const
{
  return xml::serialize(*m_doc);
}

void
chapters_c::save(bfs::path const &file_name)
  const
{
  umkv::fs::write_file(file_name, serialize());
}

}}
