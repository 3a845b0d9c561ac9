/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   the debug log file
*/

#ifndef UMKV_COMMON_LOGGER_H
#define UMKV_COMMON_LOGGER_H

#include "common/common_pch.h"

#include <boost/filesystem/fstream.hpp>

class logger_c;
typedef std::shared_ptr<logger_c> logger_cptr;

// Appends timestamped lines to a file that is truncated when the
// logger is created.
class logger_c {
private:
  bfs::path m_file_name;
  bfs::ofstream m_out;

  static bfs::path ms_directory;
  static logger_cptr ms_default_logger;

public:
  logger_c(bfs::path const &file_name);

  void log(std::string const &message);
  void log(boost::format const &message) {
    log(message.str());
  }

  bfs::path const &get_file_name() const {
    return m_file_name;
  }

  // The default logger writes "unlinkmkv-debug.log" in the directory
  // set here, or in the system's temporary directory.
  static logger_c &get_default_logger();
  static void set_directory(bfs::path const &directory);
};

template<typename T>
logger_c &
operator <<(logger_c &logger,
            T const &message) {
  logger.log(message);
  return logger;
}

#define log_it(arg) logger_c::get_default_logger() << arg

#endif // UMKV_COMMON_LOGGER_H
