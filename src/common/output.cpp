/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   console messages: information, warnings and errors
*/

#include "common/common_pch.h"

#include <iostream>

bool g_suppress_info  = false;
bool g_warning_issued = false;

static std::shared_ptr<std::ostream> s_stdio;
static std::map<unsigned int, mxmsg_handler_t> s_handlers;

void
redirect_stdio(std::shared_ptr<std::ostream> const &stdio) {
  s_stdio = stdio;
}

bool
stdio_redirected() {
  return !!s_stdio;
}

void
set_mxmsg_handler(unsigned int level,
                  mxmsg_handler_t const &handler) {
  if ((MXMSG_INFO != level) && (MXMSG_WARNING != level) && (MXMSG_ERROR != level))
    throw umkv::invalid_parameter_x{};

  s_handlers[level] = handler;
}

static void
dispatch(unsigned int level,
         std::string const &message) {
  auto handler = s_handlers.find(level);
  if ((handler == s_handlers.end()) || !handler->second)
    mxmsg(level, message);
  else
    handler->second(level, message);
}

void
mxmsg(unsigned int level,
      std::string message) {
  if (g_suppress_info && (MXMSG_INFO == level))
    return;

  auto &out = s_stdio ? *s_stdio : std::cout;

  // A leading newline goes in front of the prefix.
  if (balg::starts_with(message, "\n")) {
    out << "\n";
    message.erase(0, 1);
  }

  if ((MXMSG_ERROR == level) && !balg::starts_with(message, Y("Error:")))
    out << Y("Error: ");
  else if (MXMSG_WARNING == level)
    out << Y("Warning: ");

  out << message << std::flush;
}

void
mxinfo(std::string const &info) {
  dispatch(MXMSG_INFO, info);
}

void
mxwarn(std::string const &warning) {
  dispatch(MXMSG_WARNING, warning);
}

void
mxerror(std::string const &error) {
  dispatch(MXMSG_ERROR, error);
}

void
mxinfo_fn(bfs::path const &file_name,
          std::string const &info) {
  mxinfo(boost::format(Y("'%1%': %2%")) % file_name.string() % info);
}

void
mxwarn_fn(bfs::path const &file_name,
          std::string const &warning) {
  mxwarn(boost::format(Y("'%1%': %2%")) % file_name.string() % warning);
}

void
init_common_output() {
  set_mxmsg_handler(MXMSG_INFO, [](unsigned int, std::string const &info) {
    mxmsg(MXMSG_INFO, info);
  });

  set_mxmsg_handler(MXMSG_WARNING, [](unsigned int, std::string const &warning) {
    mxmsg(MXMSG_WARNING, warning);
    g_warning_issued = true;
  });

  set_mxmsg_handler(MXMSG_ERROR, [](unsigned int, std::string const &error) {
    mxmsg(MXMSG_ERROR, error);
    mxexit(2);
  });
}
