/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   console messages: information, warnings and errors
*/

#ifndef UMKV_COMMON_OUTPUT_H
#define UMKV_COMMON_OUTPUT_H

#include "common/common_pch.h"

#include <functional>
#include <ostream>

// A handler receives the message level (MXMSG_INFO, MXMSG_WARNING or
// MXMSG_ERROR) and the message. The defaults are installed by
// init_common_output(); tests replace them.
typedef std::function<void(unsigned int level, std::string const &)> mxmsg_handler_t;
void set_mxmsg_handler(unsigned int level, mxmsg_handler_t const &handler);
void init_common_output();

extern bool g_suppress_info, g_warning_issued;

void redirect_stdio(std::shared_ptr<std::ostream> const &new_stdio);
bool stdio_redirected();

// Writes 'message' with the prefix for its level.
void mxmsg(unsigned int level, std::string message);

void mxinfo(std::string const &info);
inline void
mxinfo(boost::format const &info) {
  mxinfo(info.str());
}
inline void
mxinfo(char const *info) {
  mxinfo(std::string{info});
}

void mxwarn(std::string const &warning);
inline void
mxwarn(boost::format const &warning) {
  mxwarn(warning.str());
}
inline void
mxwarn(char const *warning) {
  mxwarn(std::string{warning});
}

// The default handler ends the program with exit code 2.
void mxerror(std::string const &error);
inline void
mxerror(boost::format const &error) {
  mxerror(error.str());
}
inline void
mxerror(char const *error) {
  mxerror(std::string{error});
}

#define mxverb(level, message)        \
  if (verbose >= level)               \
    mxinfo(message);

// Variants naming the file the message is about.
void mxinfo_fn(bfs::path const &file_name, std::string const &info);
inline void
mxinfo_fn(bfs::path const &file_name,
          boost::format const &info) {
  mxinfo_fn(file_name, info.str());
}
inline void
mxinfo_fn(bfs::path const &file_name,
          char const *info) {
  mxinfo_fn(file_name, std::string{info});
}

void mxwarn_fn(bfs::path const &file_name, std::string const &warning);
inline void
mxwarn_fn(bfs::path const &file_name,
          boost::format const &warning) {
  mxwarn_fn(file_name, warning.str());
}
inline void
mxwarn_fn(bfs::path const &file_name,
          char const *warning) {
  mxwarn_fn(file_name, std::string{warning});
}

#endif  // UMKV_COMMON_OUTPUT_H
