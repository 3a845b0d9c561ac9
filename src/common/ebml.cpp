/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   helper functions that need libebml/libmatroska
*/

#include "common/common_pch.h"

#include <matroska/KaxTrackEntryData.h>

#include "common/ebml.h"

uint64_t
kt_get_number(KaxTrackEntry &track) {
  return FindChildValue<KaxTrackNumber>(track);
}

unsigned int
kt_get_type(KaxTrackEntry &track) {
  return FindChildValue<KaxTrackType>(track);
}

std::string
kt_get_codec_id(KaxTrackEntry &track) {
  return FindChildValue<KaxCodecID>(track);
}

// The Matroska default for a missing language element is "eng".
std::string
kt_get_language(KaxTrackEntry &track) {
  return FindChildValue<KaxTrackLanguage>(track, std::string{"eng"});
}

std::string
kt_get_name(KaxTrackEntry &track) {
  return FindChildValueUTF8<KaxTrackName>(track);
}

bool
kt_get_default_flag(KaxTrackEntry &track) {
  return 0 != FindChildValue<KaxTrackFlagDefault>(track, 1u);
}
