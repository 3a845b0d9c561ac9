/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   message catalogs
*/

#include "common/common_pch.h"

#include <clocale>

#include "common/fs_sys_helpers.h"
#include "common/translation.h"

static debugging_option_c s_debug{"locale"};

std::string
translatable_string_c::get_translated()
  const {
  if (m_text.empty())
    return m_text;
  return Y(m_text.c_str());
}

void
init_locales(std::string locale) {
#if defined(HAVE_LIBINTL_H)
  if (!locale.empty() && !setlocale(LC_MESSAGES, locale.c_str())) {
    mxdebug_if(s_debug, boost::format("setlocale(%1%) failed; using the environment's locale\n") % locale);
    locale.clear();
  }

  if (locale.empty())
    setlocale(LC_MESSAGES, "");

  auto catalog_dir = (umkv::get_installation_path() / ".." / "share" / "locale").string();

  bindtextdomain("unlinkmkv", catalog_dir.c_str());
  textdomain("unlinkmkv");
  bind_textdomain_codeset("unlinkmkv", "UTF-8");

  mxdebug_if(s_debug, boost::format("catalog directory %1%\n") % catalog_dir);

#else
  mxdebug_if(s_debug, boost::format("no translation support; ignoring locale '%1%'\n") % locale);
#endif
}
