/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   Definitions for command line helper functions
*/

#ifndef UMKV_COMMON_COMMAND_LINE_H
#define UMKV_COMMON_COMMAND_LINE_H

#include "common/common_pch.h"

extern std::string usage_text, version_info;

std::vector<std::string> command_line_args(int argc, char **argv);
void usage(int exit_code = 0);
void handle_common_cli_args(std::vector<std::string> &args, std::string const &redirect_output_short);

#endif  // UMKV_COMMON_COMMAND_LINE_H
