/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   reading segment information from Matroska files
*/

#include "common/common_pch.h"

#include <ebml/EbmlHead.h>
#include <ebml/EbmlStream.h>
#include <ebml/StdIOCallback.h>

#include <matroska/KaxAttached.h>
#include <matroska/KaxAttachments.h>
#include <matroska/KaxCluster.h>
#include <matroska/KaxInfo.h>
#include <matroska/KaxInfoData.h>
#include <matroska/KaxSegment.h>
#include <matroska/KaxTrackEntryData.h>
#include <matroska/KaxTracks.h>

#include "common/ebml.h"
#include "common/strings/formatting.h"
#include "unlink/kax_segment_prober.h"

namespace umkv {
namespace unlink {

static debugging_option_c s_debug{"kax_segment_prober"};

static bool
in_parent(EbmlElement *parent,
          IOCallback &in) {
  return !parent->IsFiniteSize() || (in.getFilePointer() < (parent->GetElementPosition() + parent->HeadSize() + parent->GetSize()));
}

static void
handle_info(KaxInfo &info,
            segment_info_t &segment) {
  auto uid = FindChild<KaxSegmentUID>(info);
  if (uid)
    segment.segment_uid = to_hex(uid->GetBuffer(), uid->GetSize(), true);

  auto timecode_scale = FindChildValue<KaxTimecodeScale>(info, 1000000ull);
  auto duration       = FindChild<KaxDuration>(info);
  if (duration)
    segment.duration = timecode_c::ns(static_cast<int64_t>(duration->GetValue() * timecode_scale + 0.5));

  segment.title = FindChildValueUTF8<KaxTitle>(info);
}

static void
handle_tracks(KaxTracks &tracks,
              segment_info_t &segment) {
  unsigned int id = 0;

  for (auto idx = 0u; tracks.ListSize() > idx; ++idx) {
    if (!is_id(tracks[idx], KaxTrackEntry))
      continue;

    auto &entry = *static_cast<KaxTrackEntry *>(tracks[idx]);
    auto type   = kt_get_type(entry);

    track_info_t track;
    track.id           = id++;
    track.number       = kt_get_number(entry);
    track.type         = track_video    == type ? tt_video
                       : track_audio    == type ? tt_audio
                       : track_subtitle == type ? tt_subtitles
                       :                          tt_other;
    track.codec_id     = kt_get_codec_id(entry);
    track.language     = kt_get_language(entry);
    track.name         = kt_get_name(entry);
    track.default_flag = kt_get_default_flag(entry);

    segment.tracks.push_back(track);
  }
}

static void
handle_attachments(KaxAttachments &attachments,
                   segment_info_t &segment) {
  unsigned int id = 0;

  for (auto idx = 0u; attachments.ListSize() > idx; ++idx) {
    if (!is_id(attachments[idx], KaxAttached))
      continue;

    auto &attached = *static_cast<KaxAttached *>(attachments[idx]);
    auto data      = FindChild<KaxFileData>(attached);

    attachment_info_t attachment;
    attachment.id        = ++id;
    attachment.uid       = FindChildValue<KaxFileUID>(attached);
    attachment.name      = FindChildValueUTF8<KaxFileName>(attached);
    attachment.mime_type = FindChildValue<KaxMimeType>(attached);
    attachment.size      = data ? data->GetSize() : 0;

    segment.attachments.push_back(attachment);
  }
}

static void
read_segment(EbmlStream &es,
             IOCallback &in,
             EbmlElement *l0,
             segment_info_t &segment) {
  int upper_lvl_el = 0;
  EbmlElement *l1  = es.FindNextElement(EBML_CONTEXT(l0), upper_lvl_el, 0xFFFFFFFFL, true, 1);
  EbmlElement *l2  = nullptr;

  while (l1 && (0 >= upper_lvl_el)) {
    if (is_id(l1, KaxInfo)) {
      l1->Read(es, EBML_CLASS_CONTEXT(KaxInfo), upper_lvl_el, l2, true);
      handle_info(*static_cast<KaxInfo *>(l1), segment);

    } else if (is_id(l1, KaxTracks)) {
      l1->Read(es, EBML_CLASS_CONTEXT(KaxTracks), upper_lvl_el, l2, true);
      handle_tracks(*static_cast<KaxTracks *>(l1), segment);

    } else if (is_id(l1, KaxAttachments)) {
      l1->Read(es, EBML_CLASS_CONTEXT(KaxAttachments), upper_lvl_el, l2, true);
      handle_attachments(*static_cast<KaxAttachments *>(l1), segment);

    } else if (is_id(l1, KaxCluster) && !l1->IsFiniteSize()) {
      // Nothing behind a cluster of unknown size can be reached without
      // parsing all of its content.
      delete l1;
      break;
    }

    if (!in_parent(l0, in)) {
      delete l1;
      break;
    }

    if (0 < upper_lvl_el) {
      upper_lvl_el--;
      if (0 < upper_lvl_el)
        break;
      delete l1;
      l1 = l2;
      continue;

    } else if (0 > upper_lvl_el) {
      upper_lvl_el++;
      if (0 > upper_lvl_el)
        break;
    }

    l1->SkipData(es, EBML_CONTEXT(l1));
    delete l1;
    l1 = es.FindNextElement(EBML_CONTEXT(l0), upper_lvl_el, 0xFFFFFFFFL, true);
  }
}

segment_info_t
probe_kax_segment(bfs::path const &file_name) {
  segment_info_t segment;
  segment.file_name = file_name;

  try {
    StdIOCallback in(file_name.string().c_str(), MODE_READ);
    EbmlStream es(in);

    // Find the EbmlHead element. Must be the first one.
    auto head = std::unique_ptr<EbmlElement>(es.FindNextID(EBML_INFO(EbmlHead), 0xFFFFFFFFL));
    if (!head)
      throw probe_failure_x{file_name, Y("No EBML head found.")};

    // Don't verify its data for now.
    head->SkipData(es, EBML_CONTEXT(head));

    std::unique_ptr<EbmlElement> l0;
    while (true) {
      l0.reset(es.FindNextID(EBML_INFO(KaxSegment), 0xFFFFFFFFFFFFFFFFLL));
      if (!l0)
        throw probe_failure_x{file_name, Y("No segment/level 0 element found.")};

      if (is_id(l0.get(), KaxSegment))
        break;

      l0->SkipData(es, EBML_CONTEXT(l0));
    }

    read_segment(es, in, l0.get(), segment);

  } catch (probe_failure_x &) {
    throw;

  } catch (std::exception &ex) {
    throw probe_failure_x{file_name, ex.what()};
  }

  if (segment.segment_uid.empty())
    throw probe_failure_x{file_name, Y("The segment does not have a segment UID.")};

  mxdebug_if(s_debug, boost::format("%1%: UID %2% duration %3% title '%4%' tracks %5% attachments %6%\n")
             % file_name.string() % segment.segment_uid % segment.duration % segment.title % segment.tracks.size() % segment.attachments.size());

  return segment;
}

}}
