/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   the generic command line option table
*/

#include "common/common_pch.h"

#include "common/cli_parser.h"
#include "common/command_line.h"
#include "common/strings/editing.h"
#include "common/strings/formatting.h"
#include "common/translation.h"

namespace {

int const s_label_column       = 2;
int const s_description_column = 30;

void
ignore_argument() {
}

}

cli_parser_c::entry_t::entry_t()
  : m_kind(ek_text)
  , m_takes_value(false)
{
}

cli_parser_c::entry_t::entry_t(kind_e kind,
                               translatable_string_c const &description)
  : m_kind(kind)
  , m_description(description)
  , m_takes_value(false)
{
}

cli_parser_c::entry_t::entry_t(std::string const &spec,
                               translatable_string_c const &description,
                               cli_parser_cb_t const &callback,
                               bool takes_value)
  : m_kind(ek_option)
  , m_spec(spec)
  , m_description(description)
  , m_callback(callback)
  , m_takes_value(takes_value)
{
}

std::string
cli_parser_c::entry_t::render()
  const {
  auto text = m_description.get_translated();

  if (ek_option == m_kind)
    return format_paragraph(text, s_description_column, std::string(s_label_column, ' ') + m_label);

  if (ek_section == m_kind)
    return std::string{"\n"} + format_paragraph(text + ":", 1);

  return format_paragraph(text, 0);
}

// ------------------------------------------------------------

cli_parser_c::cli_parser_c(std::vector<std::string> const &args)
  : m_args(args)
{
}

void
cli_parser_c::add_option(std::string const &spec,
                         cli_parser_cb_t const &callback,
                         translatable_string_c const &description) {
  auto name_and_value = split(spec, "=", 2);
  entry_t entry{spec, description, callback, name_and_value.size() == 2};

  for (auto const &name : split(name_and_value[0], "|")) {
    auto full_name = std::string(1 == name.length() ? 1 : 2, '-') + name;

    if (map_has_key(m_option_idx, full_name))
      mxerror(boost::format("cli_parser_c::add_option(): Programming error: '%1%' is used by both '%2%' and '%3%'.\n")
              % full_name % m_entries[m_option_idx[full_name]].m_spec % spec);

    m_option_idx[full_name] = m_entries.size();
    entry.m_label          += (entry.m_label.empty() ? "" : ", ") + full_name;
  }

  if (entry.m_takes_value)
    entry.m_label += " " + name_and_value[1];

  m_entries.push_back(entry);
}

void
cli_parser_c::add_section_header(translatable_string_c const &title) {
  m_entries.push_back(entry_t{entry_t::ek_section, title});
}

void
cli_parser_c::add_information(translatable_string_c const &information) {
  m_entries.push_back(entry_t{entry_t::ek_text, information});
}

void
cli_parser_c::add_separator() {
  add_information(translatable_string_c{""});
}

// These are consumed by handle_common_cli_args() before the table is
// consulted. They are listed for the usage text only.
void
cli_parser_c::add_common_options() {
  auto entries = std::vector<std::pair<std::string, translatable_string_c> >{
    { "v|verbose",                YT("Increase verbosity.")                                                 },
    { "q|quiet",                  YT("Suppress status output.")                                             },
    { "debug=<topic>",            YT("Turn on debugging output for 'topic' (or 'all').")                    },
    { "r|redirect-output=<file>", YT("Redirects all messages into this file.")                              },
    { "h|help",                   YT("Show this help.")                                                     },
    { "V|version",                YT("Show version information.")                                           },
  };

  for (auto const &entry : entries)
    add_option(entry.first, ignore_argument, entry.second);

  add_information(YT("An argument '@file' is replaced by the options read from 'file', one per line."));
}

void
cli_parser_c::set_unknown_argument_handler(cli_parser_cb_t const &handler) {
  m_unknown_arg_handler = handler;
}

void
cli_parser_c::build_usage()
  const {
  usage_text.clear();
  for (auto const &entry : m_entries)
    usage_text += entry.render();
}

void
cli_parser_c::parse_args() {
  build_usage();
  handle_common_cli_args(m_args, "");

  for (auto arg = m_args.cbegin(); arg != m_args.cend(); ++arg)
    handle_argument(arg);
}

void
cli_parser_c::handle_argument(std::vector<std::string>::const_iterator &arg) {
  auto next      = arg + 1;
  m_current_arg  = *arg;
  m_next_arg     = next == m_args.cend() ? std::string{} : *next;

  // "--name=value" is the same as "--name value".
  auto inline_value = boost::optional<std::string>{};
  auto equals_pos   = m_current_arg.find('=');
  if (balg::starts_with(m_current_arg, "--") && (std::string::npos != equals_pos)) {
    inline_value  = m_current_arg.substr(equals_pos + 1);
    m_current_arg.erase(equals_pos);
  }

  auto idx = m_option_idx.find(m_current_arg);
  if (idx == m_option_idx.end()) {
    m_current_arg = *arg;
    if (!m_unknown_arg_handler)
      mxerror(boost::format(Y("Unknown option '%1%'.\n")) % m_current_arg);
    m_unknown_arg_handler();
    return;
  }

  auto const &entry = m_entries[idx->second];

  if (!entry.m_takes_value) {
    if (inline_value)
      mxerror(boost::format(Y("The option '%1%' does not take an argument.\n")) % m_current_arg);

  } else if (inline_value)
    m_next_arg = *inline_value;

  else if (next == m_args.cend())
    mxerror(boost::format(Y("Missing argument to '%1%'.\n")) % m_current_arg);

  else
    ++arg;

  entry.m_callback();
}
