/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   merging of SSA/ASS style catalogs across several scripts
*/

#include "common/common_pch.h"

#include "common/checksums.h"
#include "common/strings/editing.h"
#include "common/strings/formatting.h"
#include "unlink/style_unifier.h"

namespace umkv {
namespace unlink {

static debugging_option_c s_debug{"style_unifier"};

std::string
source_tag_for(bfs::path const &file_name) {
  return (boost::format("u%1%") % calc_crc32(file_name.string())).str();
}

style_unifier_c::style_unifier_c(boost::optional<unsigned int> const &play_res_x,
                                 boost::optional<unsigned int> const &play_res_y)
  : m_play_res_x{play_res_x}
  , m_play_res_y{play_res_y}
{
}

void
style_unifier_c::add_file(bfs::path const &file_name) {
  add_script(file_name, ssa::script_c::load(file_name));
}

void
style_unifier_c::add_script(bfs::path const &file_name,
                            ssa::script_cptr const &script) {
  file_t file;
  file.file_name  = file_name;
  file.script     = script;
  file.schema     = ssa::resolve_schema(*script);
  file.source_tag = source_tag_for(file_name);

  // Renaming only one side would leave the events referring to styles
  // that no longer exist, so an incomplete schema leaves the file alone.
  if (!file.schema.style_name_idx)
    mxwarn_fn(file_name, Y("The styles section does not have a 'Format:' line with a 'Name' field. The file's styles and events are left unchanged.\n"));
  if (!file.schema.dialogue_style_idx)
    mxwarn_fn(file_name, Y("The events section does not have a 'Format:' line with a 'Style' field. The file's styles and events are left unchanged.\n"));

  m_files.push_back(file);
}

static bool
append_tag_to_field(std::string &line,
                    size_t idx,
                    std::string const &source_tag,
                    std::string *new_value = nullptr) {
  auto split = ssa::split_fields(line, idx + 2);
  if (split.fields.size() <= idx)
    return false;

  strip_back(split.fields[idx]);
  split.fields[idx] += " " + source_tag;
  line               = split.join();

  if (new_value)
    *new_value = strip_copy(split.fields[idx]);

  return true;
}

void
style_unifier_c::disambiguate_file(file_t &file) {
  if (!file.schema.is_complete())
    return;

  auto section = ssa::section_none;

  for (auto &line : file.script->m_lines) {
    section = ssa::section_for_line(line.content, section);

    if ((ssa::section_styles == section) && ssa::line_has_key(line.content, "Style")) {
      style_entry_t style;
      if (!append_tag_to_field(line.content, *file.schema.style_name_idx, file.source_tag, &style.name))
        continue;

      style.definition_line = line.content;
      style.source_tag      = file.source_tag;
      m_styles.push_back(style);

      mxdebug_if(s_debug, boost::format("%1%: style '%2%'\n") % file.file_name.string() % style.name);

    } else if (   (ssa::section_events == section)
               && (ssa::line_has_key(line.content, "Dialogue") || ssa::line_has_key(line.content, "Comment")))
      append_tag_to_field(line.content, *file.schema.dialogue_style_idx, file.source_tag);
  }
}

void
style_unifier_c::disambiguate() {
  for (auto &file : m_files)
    disambiguate_file(file);
}

static void
replace_value(std::string &line,
              unsigned int value) {
  auto split    = ssa::split_fields(line, 1);
  split.fields  = { to_string(static_cast<int64_t>(value)) };
  line          = split.join();
}

void
style_unifier_c::merge_file(file_t &file)
  const
{
  std::vector<ssa::line_t> new_lines;
  auto section          = ssa::section_none;
  auto styles_inserted  = false;

  for (auto const &line : file.script->m_lines) {
    section = ssa::section_for_line(line.content, section);

    if (ssa::section_styles == section) {
      if (ssa::line_has_key(line.content, "Style"))
        continue;

      new_lines.push_back(line);

      if (!styles_inserted && ssa::line_has_key(line.content, "Format")) {
        styles_inserted  = true;
        auto terminator  = line.terminator.empty() ? std::string{"\n"} : line.terminator;
        if (line.terminator.empty())
          new_lines.back().terminator = terminator;

        for (auto const &style : m_styles)
          new_lines.emplace_back(style.definition_line, terminator);
      }

      continue;
    }

    new_lines.push_back(line);

    if (m_play_res_x && ssa::line_has_key(line.content, "PlayResX"))
      replace_value(new_lines.back().content, *m_play_res_x);

    else if (m_play_res_y && ssa::line_has_key(line.content, "PlayResY"))
      replace_value(new_lines.back().content, *m_play_res_y);
  }

  file.script->m_lines = new_lines;
}

void
style_unifier_c::merge() {
  for (auto &file : m_files)
    if (file.schema.is_complete())
      merge_file(file);
}

void
style_unifier_c::save()
  const
{
  for (auto const &file : m_files)
    file.script->save(file.file_name);
}

void
unify_styles(std::vector<bfs::path> const &file_names,
             boost::optional<unsigned int> const &play_res_x,
             boost::optional<unsigned int> const &play_res_y) {
  style_unifier_c unifier{play_res_x, play_res_y};

  for (auto const &file_name : file_names)
    unifier.add_file(file_name);

  unifier.disambiguate();
  unifier.merge();
  unifier.save();

  mxverb(2, boost::format("unified %1% style(s) across %2% subtitle file(s)\n") % unifier.get_styles().size() % file_names.size());
}

}}
