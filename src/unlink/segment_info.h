/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   information about a Matroska segment
*/

#ifndef UMKV_UNLINK_SEGMENT_INFO_H
#define UMKV_UNLINK_SEGMENT_INFO_H

#include "common/common_pch.h"

#include "common/timecode.h"

namespace umkv {
namespace unlink {

enum track_type_e {
  tt_video,
  tt_audio,
  tt_subtitles,
  tt_other,
};

struct track_info_t {
  // Position of the track in the file's track list; this is the ID the
  // MKVToolNix programs use.
  unsigned int id;
  uint64_t number;
  track_type_e type;
  std::string codec_id, language, name;
  bool default_flag;

  track_info_t()
    : id{}
    , number{}
    , type{tt_other}
    , language{"eng"}
    , default_flag{true}
  {
  }

  bool is_text_subtitles() const {
    return (tt_subtitles == type) && ((codec_id == "S_TEXT/ASS") || (codec_id == "S_TEXT/SSA") || (codec_id == "S_ASS") || (codec_id == "S_SSA"));
  }
};

struct attachment_info_t {
  // 1-based position in the attachment list, used by mkvextract.
  unsigned int id;
  uint64_t uid, size;
  std::string name, mime_type;

  attachment_info_t()
    : id{}
    , uid{}
    , size{}
  {
  }
};

struct segment_info_t {
  bfs::path file_name;
  std::string segment_uid;
  timecode_c duration;
  std::string title;
  std::vector<track_info_t> tracks;
  std::vector<attachment_info_t> attachments;
};

}}

#endif  // UMKV_UNLINK_SEGMENT_INFO_H
