/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   the debug log file
*/

#include "common/common_pch.h"

#include <chrono>
#include <ctime>

#include "common/logger.h"

bfs::path logger_c::ms_directory;
logger_cptr logger_c::ms_default_logger;

static auto const s_start_time = std::chrono::steady_clock::now();

logger_c::logger_c(bfs::path const &file_name)
  : m_file_name(file_name)
{
  boost::system::error_code ec;
  if (m_file_name.has_parent_path())
    bfs::create_directories(m_file_name.parent_path(), ec);

  m_out.open(m_file_name, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!m_out)
    mxwarn(boost::format(Y("The debug log '%1%' could not be created.\n")) % m_file_name.string());
}

void
logger_c::log(std::string const &message) {
  if (!m_out)
    return;

  auto now     = std::time(nullptr);
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - s_start_time).count();

  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", std::localtime(&now));

  m_out << timestamp << " +" << elapsed << "ms " << message;
  if (!balg::ends_with(message, "\n"))
    m_out << "\n";
  m_out.flush();
}

logger_c &
logger_c::get_default_logger() {
  if (!ms_default_logger)
    ms_default_logger = std::make_shared<logger_c>((ms_directory.empty() ? bfs::temp_directory_path() : ms_directory) / "unlinkmkv-debug.log");
  return *ms_default_logger;
}

void
logger_c::set_directory(bfs::path const &directory) {
  ms_directory = directory;
  ms_default_logger.reset();
}
