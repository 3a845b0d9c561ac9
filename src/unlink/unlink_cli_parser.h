/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   command line parsing for unlinkmkv
*/

#ifndef UMKV_UNLINK_UNLINK_CLI_PARSER_H
#define UMKV_UNLINK_UNLINK_CLI_PARSER_H

#include "common/common_pch.h"

#include "common/cli_parser.h"
#include "unlink/options.h"

namespace umkv {
namespace unlink {

class unlink_cli_parser_c: public cli_parser_c {
protected:
  options_cptr m_options;

public:
  // The options passed in already contain the defaults and the values
  // from the configuration file.
  unlink_cli_parser_c(std::vector<std::string> const &args, options_cptr const &options);

  options_cptr run();

  // Returns the file named by "--config" without parsing the rest.
  static boost::optional<bfs::path> find_config_file(std::vector<std::string> const &args);

protected:
  void init_parser();

  void set_value();
  void enable_flag();
  void disable_flag();
  void set_ui_language();
  void ignore_config_file();
  void add_input();
};

}}

#endif  // UMKV_UNLINK_UNLINK_CLI_PARSER_H
