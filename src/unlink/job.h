/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   processing of one input file
*/

#ifndef UMKV_UNLINK_JOB_H
#define UMKV_UNLINK_JOB_H

#include "common/common_pch.h"

#include "common/chapters/chapters.h"
#include "unlink/options.h"
#include "unlink/segment_registry.h"
#include "unlink/timeline.h"
#include "unlink/tool_chain.h"

namespace umkv {
namespace unlink {

enum unlink_status_e {
  us_converted,
  us_not_linked,
  us_failed,
};

struct unlink_result_t {
  bfs::path file_name, output;
  unlink_status_e status;
  std::string error;

  unlink_result_t(bfs::path const &p_file_name, unlink_status_e p_status)
    : file_name{p_file_name}
    , status{p_status}
  {
  }
};

class unlink_job_c {
protected:
  options_c const &m_options;
  tool_chain_c &m_tool_chain;
  segment_registry_cache_c &m_registries;

  bfs::path m_file_name, m_work_dir, m_parts_dir, m_subtitles_dir, m_attachments_dir, m_output_dir;
  std::string m_stem;

public:
  unlink_job_c(options_c const &options, tool_chain_c &tool_chain, segment_registry_cache_c &registries, bfs::path const &file_name, size_t job_number);

  // Runs the whole pipeline. Errors are reported by throwing exceptions
  // derived from umkv::exception.
  unlink_result_t run();

  bfs::path const &get_work_dir() const {
    return m_work_dir;
  }

protected:
  void create_work_dirs();
  void remove_work_dir();

  chapters::chapters_cptr read_chapters();
  std::vector<metadata_edit_t> collect_metadata(segment_info_t const &info) const;
  std::vector<extracted_attachment_t> collect_attachments(std::vector<bfs::path> const &source_files);
  std::vector<bfs::path> realize_parts(timeline_t const &timeline);
  std::vector<bfs::path> fix_subtitles(std::vector<bfs::path> const &parts, std::vector<extracted_attachment_t> const &attachments);
  bfs::path remux_merged_subtitles(bfs::path const &merged);
};

}}

#endif  // UMKV_UNLINK_JOB_H
