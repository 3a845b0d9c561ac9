/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   program options and the configuration file
*/

#include "common/common_pch.h"

#include <boost/filesystem/fstream.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "common/fs_sys_helpers.h"
#include "common/strings/editing.h"
#include "common/strings/formatting.h"
#include "common/strings/parsing.h"
#include "unlink/options.h"

namespace bpt = boost::property_tree;

namespace umkv {
namespace unlink {

static debugging_option_c s_debug{"options"};

options_c::options_c()
  : m_outdir{bfs::current_path() / "UMKV"}
  , m_tmpdir{bfs::current_path() / "UMKV.tmp"}
  , m_fix_subtitles{true}
  , m_ignore_default_flag{}
  , m_ignore_segment_start{}
  , m_chapters{true}
  , m_cleanup{true}
  , m_edition{1}
{
}

static bool
parse_bool_value(std::string const &key,
                 std::string const &value) {
  try {
    return parse_bool(value);
  } catch (umkv::invalid_parameter_x &) {
    throw config_x{boost::format(Y("The value '%1%' for '%2%' is not a boolean value.")) % value % key};
  }
}

static unsigned int
parse_unsigned_value(std::string const &key,
                     std::string const &value,
                     unsigned int min_value) {
  unsigned int number = 0;
  if (!parse_number(strip_copy(value), number) || (number < min_value))
    throw config_x{boost::format(Y("The value '%1%' for '%2%' is not a valid number.")) % value % key};
  return number;
}

bool
options_c::set(std::string const &key,
               std::string const &value) {
  auto lkey = balg::to_lower_copy(key);

  if (lkey == "outdir")
    m_outdir = value;

  else if (lkey == "tmpdir")
    m_tmpdir = value;

  else if ((lkey == "mkvextract") || (lkey == "mkvext"))
    m_tool_paths.mkvextract = value;

  else if (lkey == "mkvmerge")
    m_tool_paths.mkvmerge = value;

  else if (lkey == "mkvpropedit")
    m_tool_paths.mkvpropedit = value;

  else if (lkey == "locale")
    m_tool_paths.ui_language = value;

  else if (lkey == "fixsubtitles")
    m_fix_subtitles = parse_bool_value(key, value);

  else if (lkey == "ignoredefaultflag")
    m_ignore_default_flag = parse_bool_value(key, value);

  else if (lkey == "ignoresegmentstart")
    m_ignore_segment_start = parse_bool_value(key, value);

  else if (lkey == "chapters")
    m_chapters = parse_bool_value(key, value);

  else if (lkey == "cleanup")
    m_cleanup = parse_bool_value(key, value);

  else if (lkey == "edition")
    m_edition = parse_unsigned_value(key, value, 1);

  else if (lkey == "playresx")
    m_play_res_x = parse_unsigned_value(key, value, 1);

  else if (lkey == "playresy")
    m_play_res_y = parse_unsigned_value(key, value, 1);

  else
    return false;

  return true;
}

static std::string
unquote(std::string value) {
  strip(value);
  if (   (value.length() >= 2)
      && (   ((value[0] == '"')  && (value[value.length() - 1] == '"'))
          || ((value[0] == '\'') && (value[value.length() - 1] == '\''))))
    value = value.substr(1, value.length() - 2);

  return value;
}

void
options_c::load_config(bfs::path const &file_name,
                       bfs::path const &base_dir) {
  bpt::ptree tree;

  try {
    bfs::ifstream in{file_name};
    if (!in)
      throw config_x{boost::format(Y("The configuration file '%1%' could not be opened.")) % file_name.string()};

    bpt::ini_parser::read_ini(in, tree);

  } catch (bpt::ini_parser_error &ex) {
    throw config_x{boost::format(Y("The configuration file '%1%' could not be parsed (line %2%): %3%")) % file_name.string() % ex.line() % ex.message()};
  }

  for (auto const &entry : tree) {
    if (!entry.second.empty()) {
      mxwarn_fn(file_name, boost::format(Y("Sections are not supported; the section '%1%' is ignored.\n")) % entry.first);
      continue;
    }

    auto value = unquote(entry.second.data());
    balg::replace_all(value, "$basedir", base_dir.string());

    mxdebug_if(s_debug, boost::format("[ini] [%1%] = [%2%]\n") % entry.first % value);

    if (!set(entry.first, value))
      mxwarn_fn(file_name, boost::format(Y("Unknown configuration key '%1%'.\n")) % entry.first);
  }
}

void
options_c::validate() {
  m_outdir = bfs::absolute(m_outdir).lexically_normal();
  m_tmpdir = bfs::absolute(m_tmpdir).lexically_normal();

  if (m_inputs.empty())
    m_inputs.push_back(bfs::current_path());
}

void
options_c::dump_info()
  const
{
  auto opt_str = [](boost::optional<unsigned int> const &value) -> std::string {
    return value ? to_string(static_cast<int64_t>(*value)) : std::string{"-"};
  };

  mxinfo(boost::format("  outdir:             %1%\n") % m_outdir.string());
  mxinfo(boost::format("  tmpdir:             %1%\n") % m_tmpdir.string());
  mxinfo(boost::format("  mkvextract:         %1%\n") % m_tool_paths.mkvextract);
  mxinfo(boost::format("  mkvmerge:           %1%\n") % m_tool_paths.mkvmerge);
  mxinfo(boost::format("  mkvpropedit:        %1%\n") % m_tool_paths.mkvpropedit);
  mxinfo(boost::format("  locale:             %1%\n") % m_tool_paths.ui_language);
  mxinfo(boost::format("  fixsubtitles:       %1%\n") % m_fix_subtitles);
  mxinfo(boost::format("  ignoredefaultflag:  %1%\n") % m_ignore_default_flag);
  mxinfo(boost::format("  ignoresegmentstart: %1%\n") % m_ignore_segment_start);
  mxinfo(boost::format("  chapters:           %1%\n") % m_chapters);
  mxinfo(boost::format("  cleanup:            %1%\n") % m_cleanup);
  mxinfo(boost::format("  edition:            %1%\n") % m_edition);
  mxinfo(boost::format("  playresx:           %1%\n") % opt_str(m_play_res_x));
  mxinfo(boost::format("  playresy:           %1%\n") % opt_str(m_play_res_y));
}

bfs::path
default_config_file() {
  return umkv::get_installation_path() / "unlinkmkv.ini";
}

}}
