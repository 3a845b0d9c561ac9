/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   OS dependant file system & system helper functions
*/

#include "common/common_pch.h"

#include <boost/filesystem/fstream.hpp>
#include <iterator>

#include "common/fs_sys_helpers.h"

#include <unistd.h>

namespace umkv {

static bfs::path s_current_executable_path;

int
get_current_process_id() {
  return getpid();
}

static bfs::path
get_current_exe_path(std::string const &argv0) {
  boost::system::error_code ec;

  auto exe = bfs::path{"/proc/self/exe"};
  if (bfs::exists(exe, ec)) {
    auto target = bfs::read_symlink(exe, ec);
    if (!ec)
      return bfs::absolute(target).parent_path();
  }

  if (argv0.empty())
    return bfs::current_path();

  exe = bfs::absolute(argv0);
  if (bfs::exists(exe, ec))
    return exe.parent_path();

  return bfs::current_path();
}

bfs::path const &
get_installation_path() {
  return s_current_executable_path;
}

void
determine_path_to_current_executable(std::string const &argv0) {
  s_current_executable_path = get_current_exe_path(argv0);
}

namespace fs {

void
create_directories(bfs::path const &path) {
  boost::system::error_code ec;
  bfs::create_directories(path, ec);
  if (ec)
    throw file_operation_x{"create_directories", path, ec.message()};
}

void
move_file(bfs::path const &from,
          bfs::path const &to) {
  boost::system::error_code ec;
  bfs::rename(from, to, ec);
  if (!ec)
    return;

  // rename() fails across file systems; fall back to copy & delete.
  ec.clear();
  bfs::copy_file(from, to, bfs::copy_options::overwrite_existing, ec);
  if (ec)
    throw file_operation_x{"move", from, ec.message()};

  bfs::remove(from, ec);
  if (ec)
    throw file_operation_x{"remove", from, ec.message()};
}

void
remove_all(bfs::path const &path) {
  boost::system::error_code ec;
  bfs::remove_all(path, ec);
  if (ec)
    throw file_operation_x{"remove_all", path, ec.message()};
}

std::string
read_file(bfs::path const &path) {
  bfs::ifstream in{path, std::ios::in | std::ios::binary};
  if (!in)
    throw file_operation_x{"open", path, Y("the file could not be opened for reading")};

  return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void
write_file(bfs::path const &path,
           std::string const &content) {
  bfs::ofstream out{path, std::ios::out | std::ios::binary | std::ios::trunc};
  if (!out)
    throw file_operation_x{"open", path, Y("the file could not be opened for writing")};

  out.write(content.data(), content.size());
  if (!out)
    throw file_operation_x{"write", path, Y("the data could not be written")};
}

}
}
