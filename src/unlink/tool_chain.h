/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   interface to the programs doing the actual Matroska work
*/

#ifndef UMKV_UNLINK_TOOL_CHAIN_H
#define UMKV_UNLINK_TOOL_CHAIN_H

#include "common/common_pch.h"

#include "common/timecode.h"
#include "unlink/segment_info.h"

namespace umkv {
namespace unlink {

struct metadata_edit_t {
  std::string selector, property, value;

  metadata_edit_t(std::string const &p_selector, std::string const &p_property, std::string const &p_value)
    : selector{p_selector}
    , property{p_property}
    , value{p_value}
  {
  }
};

struct extracted_track_t {
  unsigned int track_id;
  bfs::path file_name;

  extracted_track_t(unsigned int p_track_id, bfs::path const &p_file_name)
    : track_id{p_track_id}
    , file_name{p_file_name}
  {
  }
};

struct extracted_attachment_t {
  bfs::path file_name;
  std::string mime_type;

  extracted_attachment_t(bfs::path const &p_file_name, std::string const &p_mime_type)
    : file_name{p_file_name}
    , mime_type{p_mime_type}
  {
  }
};

// The slices in order, the command that created them and its output.
struct split_result_t {
  std::vector<bfs::path> slices;
  std::string command_line, output;
};

class tool_chain_c {
public:
  virtual ~tool_chain_c() { }

  virtual segment_info_t probe_segment(bfs::path const &file_name) = 0;
  virtual std::string extract_chapters(bfs::path const &file_name) = 0;
  virtual split_result_t split_file(bfs::path const &file_name, std::vector<timecode_c> const &split_points, bfs::path const &directory) = 0;
  virtual std::vector<extracted_track_t> extract_subtitle_tracks(bfs::path const &file_name, bfs::path const &directory) = 0;
  virtual std::vector<extracted_attachment_t> extract_attachments(bfs::path const &file_name, std::vector<attachment_info_t> const &attachments, bfs::path const &directory) = 0;
  virtual void remux_subtitles(bfs::path const &part, std::vector<extracted_track_t> const &subtitles, std::vector<extracted_attachment_t> const &attachments, bfs::path const &output) = 0;
  // Copies 'file_name' without its subtitle tracks and adds 'subtitles'
  // instead. Chapters and attachments are kept.
  virtual void replace_subtitles(bfs::path const &file_name, std::vector<extracted_track_t> const &subtitles, bfs::path const &output) = 0;
  virtual bfs::path mux_parts(std::vector<bfs::path> const &parts, boost::optional<bfs::path> const &chapters, bfs::path const &output) = 0;
  virtual void apply_metadata(bfs::path const &file_name, std::vector<metadata_edit_t> const &edits) = 0;
};
typedef std::shared_ptr<tool_chain_c> tool_chain_cptr;

}}

#endif  // UMKV_UNLINK_TOOL_CHAIN_H
