/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   command line parsing for unlinkmkv
*/

#include "common/common_pch.h"

#include "common/translation.h"
#include "unlink/unlink_cli_parser.h"

namespace umkv {
namespace unlink {

unlink_cli_parser_c::unlink_cli_parser_c(std::vector<std::string> const &args,
                                         options_cptr const &options)
  : cli_parser_c(args)
  , m_options(options)
{
}

boost::optional<bfs::path>
unlink_cli_parser_c::find_config_file(std::vector<std::string> const &args) {
  for (auto idx = 0u; args.size() > idx; ++idx) {
    if (balg::starts_with(args[idx], "--config="))
      return bfs::path{args[idx].substr(9)};

    if (args[idx] == "--config") {
      if ((idx + 1) == args.size())
        mxerror(Y("Missing argument to '--config'.\n"));
      return bfs::path{args[idx + 1]};
    }
  }

  return boost::none;
}

// "--outdir" -> "outdir"
static std::string
option_key(std::string const &arg) {
  auto key = arg;
  while (!key.empty() && (key[0] == '-'))
    key.erase(0, 1);
  if (balg::starts_with(key, "no-"))
    key.erase(0, 3);
  return key;
}

void
unlink_cli_parser_c::set_value() {
  try {
    if (!m_options->set(option_key(m_current_arg), m_next_arg))
      mxerror(boost::format(Y("Unknown option '%1%'.\n")) % m_current_arg);

  } catch (config_x &ex) {
    mxerror(boost::format(Y("Invalid argument in '%1% %2%': %3%\n")) % m_current_arg % m_next_arg % ex.error());
  }
}

void
unlink_cli_parser_c::enable_flag() {
  m_options->set(option_key(m_current_arg), "1");
}

void
unlink_cli_parser_c::disable_flag() {
  m_options->set(option_key(m_current_arg), "0");
}

void
unlink_cli_parser_c::set_ui_language() {
  m_options->m_tool_paths.ui_language = m_next_arg;
}

void
unlink_cli_parser_c::ignore_config_file() {
}

void
unlink_cli_parser_c::add_input() {
  if (!m_current_arg.empty() && (m_current_arg[0] == '-') && (m_current_arg.length() > 1))
    mxerror(boost::format(Y("Unknown option '%1%'.\n")) % m_current_arg);

  m_options->m_inputs.push_back(bfs::path{m_current_arg});
}

#define OPT(spec, func, description) add_option(spec, std::bind(&unlink_cli_parser_c::func, this), description)

void
unlink_cli_parser_c::init_parser() {
  add_information(YT("unlinkmkv [options] [files or directories]"));

  add_section_header(YT("Directories"));
  OPT("outdir=<dir>",          set_value,          YT("Write the unlinked files into this directory (default: 'UMKV' in the current directory)."));
  OPT("tmpdir=<dir>",          set_value,          YT("Use this directory for temporary files (default: 'UMKV.tmp' in the current directory)."));
  OPT("config=<file>",         ignore_config_file, YT("Read the configuration from this file instead of 'unlinkmkv.ini' next to the program."));

  add_section_header(YT("Processing options"));
  OPT("edition=<n>",           set_value,          YT("Keep the n-th edition (default: 1)."));
  OPT("ignoredefaultflag",     enable_flag,        YT("Keep editions that are not flagged as default."));
  OPT("ignoresegmentstart",    enable_flag,        YT("Include linked segments even if the chapter does not start at their beginning."));
  OPT("fixsubtitles",          enable_flag,        YT("Unify the styles of SSA/ASS subtitles across all parts (default)."));
  OPT("no-fixsubtitles",       disable_flag,       YT("Leave the subtitles unchanged."));
  OPT("playresx=<n>",          set_value,          YT("Force the subtitles' horizontal script resolution."));
  OPT("playresy=<n>",          set_value,          YT("Force the subtitles' vertical script resolution."));
  OPT("chapters",              enable_flag,        YT("Add the flattened chapters to the output file (default)."));
  OPT("no-chapters",           disable_flag,       YT("Do not add chapters to the output file."));
  OPT("cleanup",               enable_flag,        YT("Remove the temporary files after each file (default)."));
  OPT("no-cleanup",            disable_flag,       YT("Keep the temporary files."));

  add_section_header(YT("External programs"));
  OPT("mkvextract=<program>",  set_value,          YT("Use this mkvextract executable."));
  OPT("mkvmerge=<program>",    set_value,          YT("Use this mkvmerge executable."));
  OPT("mkvpropedit=<program>", set_value,          YT("Use this mkvpropedit executable."));
  OPT("ui-language=<code>",    set_ui_language,    YT("Force the translations for 'code' to be used and pass the language on to the external programs."));

  add_section_header(YT("Other options"));
  add_common_options();

  add_separator();
  add_information(YT("Without files or directories the current directory is processed. For directories every '*.mkv' file that does not exist in the output directory yet is processed."));

  set_unknown_argument_handler(std::bind(&unlink_cli_parser_c::add_input, this));
}

#undef OPT

options_cptr
unlink_cli_parser_c::run() {
  init_parser();

  parse_args();

  m_options->validate();

  return m_options;
}

}}
