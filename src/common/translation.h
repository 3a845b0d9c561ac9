/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   message catalogs
*/

#ifndef UMKV_COMMON_TRANSLATION_H
#define UMKV_COMMON_TRANSLATION_H

#include "common/common_pch.h"

// Holds the untranslated text so that help texts can be built before
// the user interface language is known.
class translatable_string_c {
protected:
  std::string m_text;

public:
  translatable_string_c(std::string const &text = std::string{})
    : m_text(text)
  {
  }

  translatable_string_c(char const *text)
    : m_text(text)
  {
  }

  std::string get_translated() const;
};

#define YT(s) translatable_string_c(s)

// Binds the "unlinkmkv" catalog from <installation>/../share/locale.
// An empty or unknown 'locale' uses the environment's.
void init_locales(std::string locale = "");

#endif  // UMKV_COMMON_TRANSLATION_H
