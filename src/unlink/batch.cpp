/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   processing of all input files
*/

#include "common/common_pch.h"

#include "common/fs_sys_helpers.h"
#include "unlink/batch.h"

namespace umkv {
namespace unlink {

batch_c::batch_c(options_c const &options,
                 tool_chain_c &tool_chain)
  : m_options(options)
  , m_tool_chain(tool_chain)
  , m_registries{tool_chain}
{
}

std::vector<bfs::path>
batch_c::collect_files()
  const
{
  std::vector<bfs::path> files;
  boost::system::error_code ec;

  for (auto const &input : m_options.m_inputs) {
    if (bfs::is_directory(input, ec)) {
      for (bfs::directory_iterator it{input, ec}, end; !ec && (it != end); it.increment(ec)) {
        auto const &path = it->path();
        boost::system::error_code file_ec;
        if (   !balg::iequals(path.extension().string(), ".mkv")
            || !bfs::is_regular_file(path, file_ec)
            || bfs::exists(m_options.m_outdir / path.filename(), file_ec))
          continue;

        files.push_back(bfs::absolute(path).lexically_normal());
      }

      if (ec)
        throw umkv::fs::file_operation_x{"read_directory", input, ec.message()};

    } else if (bfs::is_regular_file(input, ec))
      files.push_back(bfs::absolute(input).lexically_normal());

    else
      mxwarn(boost::format(Y("The file or directory '%1%' does not exist.\n")) % input.string());
  }

  brng::sort(files);
  files.erase(std::unique(files.begin(), files.end()), files.end());

  return files;
}

unlink_result_t
batch_c::process_file(bfs::path const &file_name,
                      size_t job_number) {
  try {
    return unlink_job_c{m_options, m_tool_chain, m_registries, file_name, job_number}.run();

  } catch (umkv::exception &ex) {
    mxwarn_fn(file_name, boost::format(Y("Unlinking failed: %1%\n")) % ex.error());

    unlink_result_t result{file_name, us_failed};
    result.error = ex.error();
    return result;

  } catch (std::exception &ex) {
    mxwarn_fn(file_name, boost::format(Y("Unlinking failed: %1%\n")) % ex.what());

    unlink_result_t result{file_name, us_failed};
    result.error = ex.what();
    return result;
  }
}

void
batch_c::show_summary()
  const
{
  auto count = [this](unlink_status_e status) {
    return brng::count_if(m_results, [status](unlink_result_t const &result) { return result.status == status; });
  };

  mxinfo(boost::format(Y("%1% file(s) converted, %2% not linked, %3% failed.\n")) % count(us_converted) % count(us_not_linked) % count(us_failed));

  for (auto const &result : m_results)
    if (us_failed == result.status)
      mxinfo(boost::format(Y("  failed: %1%\n")) % result.file_name.string());
}

int
batch_c::run() {
  auto files = collect_files();
  if (files.empty())
    mxinfo(Y("No files to process.\n"));

  size_t job_number = 0;
  for (auto const &file_name : files)
    m_results.push_back(process_file(file_name, ++job_number));

  show_summary();

  auto any_failed = brng::find_if(m_results, [](unlink_result_t const &result) { return us_failed == result.status; }) != m_results.end();
  return any_failed ? 2 : 0;
}

}}
