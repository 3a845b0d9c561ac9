/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   string splitting and whitespace removal
*/

#ifndef UMKV_COMMON_STRINGS_EDITING_H
#define UMKV_COMMON_STRINGS_EDITING_H

#include "common/common_pch.h"

// Splits at every occurrence of 'separator'. With 'max' > 0 at most
// 'max' parts are returned; the last one holds the rest of the text.
std::vector<std::string> split(std::string const &text, std::string const &separator = ",", size_t max = 0);

// Removes blanks and tabs (and with 'newlines' also CR and LF) from
// both ends or from the end only.
void strip(std::string &s, bool newlines = false);
void strip_back(std::string &s, bool newlines = false);
std::string strip_copy(std::string const &s, bool newlines = false);

extern std::string const empty_string;

#endif  // UMKV_COMMON_STRINGS_EDITING_H
