/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   running external programs
*/

#ifndef UMKV_COMMON_PROCESS_H
#define UMKV_COMMON_PROCESS_H

#include "common/common_pch.h"

namespace umkv {
namespace process {

class exception: public umkv::exception {
public:
  virtual const char *what() const throw() {
    return "external program error";
  }
};

class external_tool_failure_x: public exception {
protected:
  std::string m_command_line, m_output, m_message;
  int m_exit_code;
public:
  external_tool_failure_x(std::string const &command_line, int exit_code, std::string const &output, std::string const &message = std::string{})
    : m_command_line(command_line)
    , m_output(output)
    , m_message(message)
    , m_exit_code(exit_code)
  {
  }
  virtual ~external_tool_failure_x() throw() { }

  virtual const char *what() const throw() {
    return "external program failed";
  }
  // Always names the command line; the output follows if there was any.
  virtual std::string error() const throw() {
    std::string msg = m_message.empty() ? (boost::format(Y("The command '%1%' failed with exit code %2%.")) % m_command_line % m_exit_code).str()
                    :                     (boost::format(Y("%1% The command was '%2%'.")) % m_message % m_command_line).str();
    if (!m_output.empty())
      msg += (boost::format(Y(" Its output was: %1%")) % m_output).str();
    return msg;
  }

  std::string const &command_line() const {
    return m_command_line;
  }
  std::string const &output() const {
    return m_output;
  }
  int exit_code() const {
    return m_exit_code;
  }
};

struct result_t {
  int exit_code;
  std::string out, err;

  result_t()
    : exit_code{}
  {
  }
};

std::string format_command_line(std::string const &program, std::vector<std::string> const &args);

// Runs the program synchronously and captures its standard output and
// standard error. Throws external_tool_failure_x if the program cannot
// be started; the exit code is returned in the result.
result_t run(std::string const &program, std::vector<std::string> const &args);

// Like run(), but also throws external_tool_failure_x if the exit code
// is bigger than max_ok_exit_code.
result_t run_checked(std::string const &program, std::vector<std::string> const &args, int max_ok_exit_code = 0);

}}

#endif  // UMKV_COMMON_PROCESS_H
