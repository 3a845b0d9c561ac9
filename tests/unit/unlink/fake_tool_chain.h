/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   tool chain replacement that works on plain files for unit tests
*/

#ifndef UMKV_TESTS_UNIT_UNLINK_FAKE_TOOL_CHAIN_H
#define UMKV_TESTS_UNIT_UNLINK_FAKE_TOOL_CHAIN_H

#include "common/common_pch.h"

#include "unlink/tool_chain.h"

namespace umkvut {

using namespace umkv::unlink;

// Every method records its call. Files named in m_segments are
// "Matroska files"; all others fail to probe. Created files contain a
// short description of how they were made.
class fake_tool_chain_c: public tool_chain_c {
public:
  std::map<bfs::path, segment_info_t> m_segments;
  std::map<bfs::path, std::string> m_chapters;
  std::map<bfs::path, std::vector<std::string>> m_subtitles;

  std::vector<bfs::path> m_probed;
  std::vector<std::vector<timecode_c>> m_split_points;
  std::vector<bfs::path> m_split_files;
  std::vector<std::vector<bfs::path>> m_muxed_parts;
  std::vector<boost::optional<bfs::path>> m_muxed_chapters;
  std::vector<bfs::path> m_remuxed_parts, m_replaced_subtitles_in;
  std::vector<std::vector<extracted_attachment_t>> m_remuxed_attachments;
  std::vector<std::vector<attachment_info_t>> m_extracted_attachments;
  std::vector<metadata_edit_t> m_metadata;
  std::string m_muxed_chapters_content;
  size_t m_num_slices_override;

public:
  fake_tool_chain_c();
  virtual ~fake_tool_chain_c() { }

  // Registers a segment with one audio and one subtitle track.
  segment_info_t &add_segment(bfs::path const &file_name, std::string const &segment_uid, timecode_c const &duration);
  segment_info_t &get_segment(bfs::path const &file_name);
  void set_chapters(bfs::path const &file_name, std::string const &chapters);
  void set_subtitles(bfs::path const &file_name, std::vector<std::string> const &subtitles);
  void add_attachment(bfs::path const &file_name, std::string const &name, std::string const &mime_type);

  virtual segment_info_t probe_segment(bfs::path const &file_name);
  virtual std::string extract_chapters(bfs::path const &file_name);
  virtual split_result_t split_file(bfs::path const &file_name, std::vector<timecode_c> const &split_points, bfs::path const &directory);
  virtual std::vector<extracted_track_t> extract_subtitle_tracks(bfs::path const &file_name, bfs::path const &directory);
  virtual std::vector<extracted_attachment_t> extract_attachments(bfs::path const &file_name, std::vector<attachment_info_t> const &attachments, bfs::path const &directory);
  virtual void remux_subtitles(bfs::path const &part, std::vector<extracted_track_t> const &subtitles, std::vector<extracted_attachment_t> const &attachments, bfs::path const &output);
  virtual void replace_subtitles(bfs::path const &file_name, std::vector<extracted_track_t> const &subtitles, bfs::path const &output);
  virtual bfs::path mux_parts(std::vector<bfs::path> const &parts, boost::optional<bfs::path> const &chapters, bfs::path const &output);
  virtual void apply_metadata(bfs::path const &file_name, std::vector<metadata_edit_t> const &edits);
};

}

#endif // UMKV_TESTS_UNIT_UNLINK_FAKE_TOOL_CHAIN_H
