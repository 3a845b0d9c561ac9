/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   command line argument collection and the options every program shares
*/

#include "common/common_pch.h"

#include <boost/filesystem/fstream.hpp>

#include "common/command_line.h"
#include "common/strings/editing.h"
#include "common/translation.h"

std::string usage_text, version_info;

/** \brief Appends the arguments stored in an option file

   One argument per line. Empty lines and lines starting with '#' are
   skipped; a line consisting of "#EMPTY#" stands for an empty
   argument.
*/
static void
read_args_from_file(std::vector<std::string> &args,
                    bfs::path const &file_name) {
  bfs::ifstream in{file_name};
  if (!in)
    mxerror(boost::format(Y("The file '%1%' could not be opened for reading command line arguments.\n")) % file_name.string());

  std::string line;
  while (std::getline(in, line)) {
    strip(line, true);

    if (line == "#EMPTY#")
      args.push_back(std::string{});
    else if (!line.empty() && (line[0] != '#'))
      args.push_back(line);
  }
}

/** \brief Collects the program's arguments

   The words of the environment variable \c UNLINKMKV_OPTIONS come
   first. An argument "@file" is replaced by the contents of \c file.
*/
std::vector<std::string>
command_line_args(int argc,
                  char **argv) {
  std::vector<std::string> args;

  auto from_env = getenv("UNLINKMKV_OPTIONS");
  if (from_env)
    for (auto const &word : split(from_env, " "))
      if (!word.empty())
        args.push_back(word);

  for (int idx = 1; idx < argc; ++idx)
    if (argv[idx][0] == '@')
      read_args_from_file(args, bfs::path{&argv[idx][1]});
    else
      args.push_back(argv[idx]);

  return args;
}

// Removes every occurrence of one of 'names' together with its value
// ("--name value" or "--name=value") and hands the value to 'handle'.
static void
take_option_with_value(std::vector<std::string> &args,
                       std::vector<std::string> const &names,
                       std::function<void(std::string const &, std::string const &)> const &handle) {
  auto arg = args.begin();
  while (arg != args.end()) {
    auto equals_pos = arg->find('=');
    if (balg::starts_with(*arg, "--") && (std::string::npos != equals_pos) && brng::count(names, arg->substr(0, equals_pos))) {
      auto name  = arg->substr(0, equals_pos);
      auto value = arg->substr(equals_pos + 1);
      arg        = args.erase(arg);

      handle(name, value);
      continue;
    }

    if (!brng::count(names, *arg)) {
      ++arg;
      continue;
    }

    if ((arg + 1) == args.end())
      mxerror(boost::format(Y("Missing argument to '%1%'.\n")) % *arg);

    auto name  = *arg;
    auto value = *(arg + 1);
    arg        = args.erase(arg, arg + 2);

    handle(name, value);
  }
}

/** Handles the arguments every program understands

   These are --debug, --redirect-output, --verbose, --quiet, --help and
   --version along with their short forms. All but --help and --version
   are removed from \c args; those two end the program.
*/
void
handle_common_cli_args(std::vector<std::string> &args,
                       std::string const &redirect_output_short) {
  take_option_with_value(args, { "--debug" }, [](std::string const &, std::string const &topics) {
    debugging_c::request(topics);
  });

  auto redirect_names = std::vector<std::string>{ "--redirect-output", "-r" };
  if (!redirect_output_short.empty())
    redirect_names.push_back(redirect_output_short);

  take_option_with_value(args, redirect_names, [](std::string const &, std::string const &file_name) {
    if (stdio_redirected())
      return;

    auto file = std::make_shared<bfs::ofstream>(bfs::path{file_name}, std::ios::out | std::ios::trunc);
    if (!*file)
      mxerror(boost::format(Y("Could not open the file '%1%' for directing the output.\n")) % file_name);
    redirect_stdio(file);
  });

  // --ui-language stays in the list; programs pass it on to the tools
  // they run.
  for (auto arg = args.cbegin(); arg != args.cend(); ++arg)
    if (*arg == "--ui-language") {
      if ((arg + 1) == args.cend())
        mxerror(Y("Missing argument to '--ui-language'.\n"));
      init_locales(*(arg + 1));
      ++arg;
    }

  auto arg = args.begin();
  while (arg != args.end()) {
    if ((*arg == "-V") || (*arg == "--version")) {
      mxinfo(boost::format("%1%\n") % version_info);
      mxexit(0);

    } else if ((*arg == "-h") || (*arg == "-?") || (*arg == "--help"))
      usage();

    if ((*arg == "-v") || (*arg == "--verbose")) {
      ++verbose;
      arg = args.erase(arg);

    } else if ((*arg == "-q") || (*arg == "--quiet")) {
      verbose         = 0;
      g_suppress_info = true;
      arg             = args.erase(arg);

    } else
      ++arg;
  }
}

void
usage(int exit_code) {
  mxinfo(boost::format("%1%\n") % usage_text);
  mxexit(exit_code);
}
