/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   main program
*/

#include "common/common_pch.h"

#include "common/command_line.h"
#include "common/fs_sys_helpers.h"
#include "common/logger.h"
#include "common/process.h"
#include "common/version.h"
#include "unlink/batch.h"
#include "unlink/mkvtoolnix_tool_chain.h"
#include "unlink/unlink_cli_parser.h"

using namespace umkv::unlink;

static void
setup(char **argv) {
  umkv_common_init(argv[0]);
  version_info = get_version_info("unlinkmkv", true);
}

static options_cptr
load_options(std::vector<std::string> const &args) {
  auto options     = std::make_shared<options_c>();
  auto config_file = unlink_cli_parser_c::find_config_file(args);

  try {
    if (config_file)
      options->load_config(*config_file, bfs::absolute(*config_file).parent_path());

    else if (bfs::exists(default_config_file()))
      options->load_config(default_config_file(), umkv::get_installation_path());

  } catch (config_x &ex) {
    mxerror(boost::format("%1%\n") % ex.error());
  }

  return unlink_cli_parser_c(args, options).run();
}

static void
check_tools(options_c const &options) {
  try {
    auto output  = mkvtoolnix_tool_chain_c{options.m_tool_paths}.query_mkvmerge_version();
    auto version = version_number_t{output};

    if (!version.valid)
      mxwarn(boost::format(Y("The version of mkvmerge could not be determined from its output '%1%'.\n")) % output);
    else
      mxverb(1, boost::format(Y("Using mkvmerge v%1%.\n")) % version.to_string());

  } catch (umkv::process::exception &ex) {
    mxerror(boost::format(Y("mkvmerge could not be run: %1%\n")) % ex.error());
  }
}

int
main(int argc,
     char **argv) {
  setup(argv);

  auto options = load_options(command_line_args(argc, argv));
  logger_c::set_directory(options->m_tmpdir);

  if (debugging_c::requested("dump_options")) {
    mxinfo("\nDumping options after parsing the command line\n\n");
    options->dump_info();
  }

  check_tools(*options);

  mkvtoolnix_tool_chain_c tool_chain{options->m_tool_paths};
  auto exit_code = 0;

  try {
    exit_code = batch_c{*options, tool_chain}.run();
  } catch (umkv::exception &ex) {
    mxerror(boost::format("%1%\n") % ex.error());
  }

  mxexit(exit_code);
}
