/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   Cross platform helper functions
*/

#ifndef UMKV_COMMON_FS_SYS_HELPERS_H
#define UMKV_COMMON_FS_SYS_HELPERS_H

#include "common/common_pch.h"

namespace umkv {
namespace fs {

class exception: public umkv::exception {
public:
  virtual const char *what() const throw() {
    return "generic file system error";
  }
};

class file_operation_x: public exception {
protected:
  std::string m_operation, m_path, m_error;
public:
  file_operation_x(std::string const &operation, bfs::path const &path, std::string const &error)
    : m_operation(operation)
    , m_path(path.string())
    , m_error(error)
  {
  }
  virtual ~file_operation_x() throw() { }

  virtual const char *what() const throw() {
    return "file operation failed";
  }
  virtual std::string error() const throw() {
    return (boost::format(Y("%1%(%2%) failed: %3%")) % m_operation % m_path % m_error).str();
  }
};

void create_directories(bfs::path const &path);
void move_file(bfs::path const &from, bfs::path const &to);
void remove_all(bfs::path const &path);
std::string read_file(bfs::path const &path);
void write_file(bfs::path const &path, std::string const &content);

}

int get_current_process_id();

bfs::path const &get_installation_path();
void determine_path_to_current_executable(std::string const &argv0);

}

#endif  // UMKV_COMMON_FS_SYS_HELPERS_H
