/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   running external programs
*/

#include "common/common_pch.h"

#include <future>

#include <boost/asio.hpp>
#include <boost/process.hpp>

#include "common/process.h"
#include "common/strings/editing.h"

namespace bp = boost::process;

namespace umkv {
namespace process {

static debugging_option_c s_debug{"process"};

static std::string
quote_argument(std::string const &arg) {
  if (!arg.empty() && (std::string::npos == arg.find_first_of(" \t\"'\\")))
    return arg;

  std::string quoted = "\"";
  for (auto c : arg) {
    if ((c == '"') || (c == '\\'))
      quoted += '\\';
    quoted += c;
  }

  return quoted + "\"";
}

std::string
format_command_line(std::string const &program,
                    std::vector<std::string> const &args) {
  std::string command_line = quote_argument(program);
  for (auto const &arg : args)
    command_line += " " + quote_argument(arg);

  return command_line;
}

static bfs::path
find_program(std::string const &program) {
  auto path = bfs::path{program};
  if (path.has_parent_path())
    return path;

  auto found = bp::search_path(program);
  return found.empty() ? path : bfs::path{found.string()};
}

result_t
run(std::string const &program,
    std::vector<std::string> const &args) {
  auto command_line = format_command_line(program, args);
  mxdebug_if(s_debug, boost::format("running %1%\n") % command_line);

  result_t result;

  try {
    boost::asio::io_service ios;
    std::future<std::string> out, err;

    bp::child child(bp::exe = find_program(program).string(), bp::args = args, bp::std_in.close(), bp::std_out > out, bp::std_err > err, ios);

    ios.run();
    child.wait();

    result.exit_code = child.exit_code();
    result.out       = out.get();
    result.err       = err.get();

  } catch (bp::process_error &ex) {
    throw external_tool_failure_x{command_line, -1, std::string{}, (boost::format(Y("The program '%1%' could not be executed: %2%")) % program % ex.what()).str()};
  }

  mxdebug_if(s_debug, boost::format("exit code %1%; stdout: %2%; stderr: %3%\n") % result.exit_code % strip_copy(result.out, true) % strip_copy(result.err, true));

  return result;
}

result_t
run_checked(std::string const &program,
            std::vector<std::string> const &args,
            int max_ok_exit_code) {
  auto result = run(program, args);

  if ((0 > result.exit_code) || (result.exit_code > max_ok_exit_code)) {
    auto output = strip_copy(result.out + result.err, true);
    throw external_tool_failure_x{format_command_line(program, args), result.exit_code, output};
  }

  return result;
}

}}
