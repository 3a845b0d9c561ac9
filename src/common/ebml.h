/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   helper functions that need libebml/libmatroska
*/

#ifndef UMKV_COMMON_EBML_H
#define UMKV_COMMON_EBML_H

#include "common/common_pch.h"

#include <ebml/EbmlMaster.h>
#include <ebml/EbmlUnicodeString.h>

#include <matroska/KaxTracks.h>

using namespace libebml;
using namespace libmatroska;

#define is_id(e, ref) (EbmlId(*e) == EBML_ID(ref))
#if !defined(EBML_INFO)
#define EBML_INFO(ref)  ref::ClassInfos
#endif
#if !defined(EBML_ID)
#define EBML_ID(ref)  ref::ClassInfos.GlobalId
#endif
#if !defined(EBML_CLASS_CONTEXT)
#define EBML_CLASS_CONTEXT(ref) ref::ClassInfos.Context
#endif
#if !defined(EBML_CONTEXT)
#define EBML_CONTEXT(e)  e->Generic().Context
#endif

template <typename T>
T *
FindChild(EbmlMaster const &m) {
  return static_cast<T *>(m.FindFirstElt(EBML_INFO(T)));
}

template<typename Telement,
         typename Tvalue = decltype(Telement().GetValue())>
decltype(Telement().GetValue())
FindChildValue(EbmlMaster &master,
               Tvalue const &default_value = Tvalue{}) {
  auto child = FindChild<Telement>(master);
  return child ? child->GetValue() : default_value;
}

template<typename Telement>
std::string
FindChildValueUTF8(EbmlMaster &master,
                   std::string const &default_value = std::string{}) {
  auto child = FindChild<Telement>(master);
  return child ? child->GetValueUTF8() : default_value;
}

// Values of a track entry's children with the Matroska defaults for
// missing elements.
uint64_t kt_get_number(KaxTrackEntry &track);
unsigned int kt_get_type(KaxTrackEntry &track);
std::string kt_get_codec_id(KaxTrackEntry &track);
std::string kt_get_language(KaxTrackEntry &track);
std::string kt_get_name(KaxTrackEntry &track);
bool kt_get_default_flag(KaxTrackEntry &track);

#endif // UMKV_COMMON_EBML_H
