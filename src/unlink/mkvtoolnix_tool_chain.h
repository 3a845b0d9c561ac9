/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   tool chain running mkvextract, mkvmerge and mkvpropedit
*/

#ifndef UMKV_UNLINK_MKVTOOLNIX_TOOL_CHAIN_H
#define UMKV_UNLINK_MKVTOOLNIX_TOOL_CHAIN_H

#include "common/common_pch.h"

#include "unlink/tool_chain.h"

namespace umkv {
namespace unlink {

struct tool_paths_t {
  std::string mkvextract, mkvmerge, mkvpropedit, ui_language;

  tool_paths_t()
    : mkvextract{"mkvextract"}
    , mkvmerge{"mkvmerge"}
    , mkvpropedit{"mkvpropedit"}
    , ui_language{"en_US"}
  {
  }
};

class mkvtoolnix_tool_chain_c: public tool_chain_c {
protected:
  tool_paths_t m_paths;

public:
  mkvtoolnix_tool_chain_c(tool_paths_t const &paths);
  virtual ~mkvtoolnix_tool_chain_c() { }

  virtual segment_info_t probe_segment(bfs::path const &file_name);
  virtual std::string extract_chapters(bfs::path const &file_name);
  virtual split_result_t split_file(bfs::path const &file_name, std::vector<timecode_c> const &split_points, bfs::path const &directory);
  virtual std::vector<extracted_track_t> extract_subtitle_tracks(bfs::path const &file_name, bfs::path const &directory);
  virtual std::vector<extracted_attachment_t> extract_attachments(bfs::path const &file_name, std::vector<attachment_info_t> const &attachments, bfs::path const &directory);
  virtual void remux_subtitles(bfs::path const &part, std::vector<extracted_track_t> const &subtitles, std::vector<extracted_attachment_t> const &attachments, bfs::path const &output);
  virtual void replace_subtitles(bfs::path const &file_name, std::vector<extracted_track_t> const &subtitles, bfs::path const &output);
  virtual bfs::path mux_parts(std::vector<bfs::path> const &parts, boost::optional<bfs::path> const &chapters, bfs::path const &output);
  virtual void apply_metadata(bfs::path const &file_name, std::vector<metadata_edit_t> const &edits);

  // Returns the version reported by "mkvmerge --version".
  std::string query_mkvmerge_version();

protected:
  std::vector<std::string> with_ui_language(std::vector<std::string> args) const;
  std::string run(std::string const &program, std::vector<std::string> args, int max_ok_exit_code = 0);
};

}}

#endif  // UMKV_UNLINK_MKVTOOLNIX_TOOL_CHAIN_H
