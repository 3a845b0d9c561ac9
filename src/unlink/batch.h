/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   processing of all input files
*/

#ifndef UMKV_UNLINK_BATCH_H
#define UMKV_UNLINK_BATCH_H

#include "common/common_pch.h"

#include "unlink/job.h"

namespace umkv {
namespace unlink {

class batch_c {
protected:
  options_c const &m_options;
  tool_chain_c &m_tool_chain;
  segment_registry_cache_c m_registries;
  std::vector<unlink_result_t> m_results;

public:
  batch_c(options_c const &options, tool_chain_c &tool_chain);

  // Expands directories into the *.mkv files they contain that don't
  // exist in the output directory yet. The result is sorted.
  std::vector<bfs::path> collect_files() const;

  // Processes every file and returns the program's exit code: 0 if no
  // file failed, 2 otherwise.
  int run();

  std::vector<unlink_result_t> const &get_results() const {
    return m_results;
  }

protected:
  unlink_result_t process_file(bfs::path const &file_name, size_t job_number);
  void show_summary() const;
};

}}

#endif  // UMKV_UNLINK_BATCH_H
