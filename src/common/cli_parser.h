/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   declarations for the generic command line option table
*/

#ifndef UMKV_COMMON_CLI_PARSER_H
#define UMKV_COMMON_CLI_PARSER_H

#include "common/common_pch.h"

#include <functional>

#include "common/translation.h"

typedef std::function<void(void)> cli_parser_cb_t;

class cli_parser_c {
protected:
  struct entry_t {
    enum kind_e {
      ek_option,
      ek_section,
      ek_text,
    };

    kind_e m_kind;
    std::string m_spec, m_label;
    translatable_string_c m_description;
    cli_parser_cb_t m_callback;
    bool m_takes_value;

    entry_t();
    entry_t(kind_e kind, translatable_string_c const &description);
    entry_t(std::string const &spec, translatable_string_c const &description, cli_parser_cb_t const &callback, bool takes_value);

    std::string render() const;
  };

  std::vector<entry_t> m_entries;
  std::map<std::string, size_t> m_option_idx;
  std::vector<std::string> m_args;
  cli_parser_cb_t m_unknown_arg_handler;

  // The argument currently being handled and its value. For an option
  // without a value m_next_arg is the following argument (or empty).
  std::string m_current_arg, m_next_arg;

protected:
  cli_parser_c(std::vector<std::string> const &args);
  virtual ~cli_parser_c() { }

  // 'spec' is "name|alias=<value>"; single character names get one
  // dash, all others two.
  void add_option(std::string const &spec, cli_parser_cb_t const &callback, translatable_string_c const &description);
  void add_section_header(translatable_string_c const &title);
  void add_information(translatable_string_c const &information);
  void add_separator();
  void add_common_options();

  // Called for every argument that is not a known option.
  void set_unknown_argument_handler(cli_parser_cb_t const &handler);

  void parse_args();
  void build_usage() const;

private:
  void handle_argument(std::vector<std::string>::const_iterator &arg);
};

#endif // UMKV_COMMON_CLI_PARSER_H
