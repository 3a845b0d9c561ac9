/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   program wide state and start-up
*/

#include "common/common_pch.h"

#include "common/fs_sys_helpers.h"
#include "common/translation.h"

unsigned int verbose = 1;

void
mxexit(int code) {
  if (-1 == code)
    code = g_warning_issued ? 1 : 0;

  std::exit(code);
}

void
umkv_common_init(char const *argv0) {
  init_common_output();
  umkv::determine_path_to_current_executable(argv0 ? argv0 : "");
  debugging_c::init();
  init_locales();
}
