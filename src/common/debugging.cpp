/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   debug output switched on per topic
*/

#include "common/common_pch.h"

#include "common/debugging.h"
#include "common/logger.h"

std::set<std::string> debugging_c::ms_topics;
unsigned int debugging_c::ms_generation     = 0;
bool debugging_c::ms_send_to_logger         = false;

void
debugging_c::request(std::string const &topics) {
  std::vector<std::string> words;
  balg::split(words, topics, balg::is_any_of(", "), balg::token_compress_on);

  for (auto const &word : words)
    if (word == "to_logger")
      ms_send_to_logger = true;
    else if (!word.empty())
      ms_topics.insert(word);

  ++ms_generation;
}

bool
debugging_c::requested(std::string const &topics) {
  if (ms_topics.count("all"))
    return true;

  std::vector<std::string> alternatives;
  balg::split(alternatives, topics, balg::is_any_of("|"));

  return brng::find_if(alternatives, [](std::string const &topic) { return ms_topics.count(topic) != 0; }) != alternatives.end();
}

void
debugging_c::init() {
  auto value = getenv("UNLINKMKV_DEBUG");
  if (value)
    request(value);
}

void
debugging_c::output(std::string const &msg) {
  if (ms_send_to_logger)
    log_it(msg);
  else
    mxmsg(MXMSG_INFO, balg::ends_with(msg, "\n") ? msg : msg + "\n");
}
