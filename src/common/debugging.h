/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   debug output switched on per topic
*/

#ifndef UMKV_COMMON_DEBUGGING_H
#define UMKV_COMMON_DEBUGGING_H

#include "common/common_pch.h"

#include <set>

class debugging_c {
protected:
  static std::set<std::string> ms_topics;
  static unsigned int ms_generation;
  static bool ms_send_to_logger;

public:
  // 'topics' is a list separated by spaces or commas. "to_logger"
  // sends the output to the debug log instead of the console.
  static void request(std::string const &topics);
  // True if one of the '|' separated topics or "all" was requested.
  static bool requested(std::string const &topics);
  static void init();

  static unsigned int generation() {
    return ms_generation;
  }

  static void output(std::string const &msg);
  static void output(boost::format const &msg) {
    output(msg.str());
  }
};

// A topic switch for file scope variables. The lookup is cached until
// the next request().
class debugging_option_c {
protected:
  std::string m_topic;
  mutable unsigned int m_generation;
  mutable bool m_requested;

public:
  debugging_option_c(std::string const &topic)
    : m_topic{topic}
    , m_generation{std::numeric_limits<unsigned int>::max()}
    , m_requested{}
  {
  }

  operator bool() const {
    if (m_generation != debugging_c::generation()) {
      m_requested  = debugging_c::requested(m_topic);
      m_generation = debugging_c::generation();
    }

    return m_requested;
  }
};

#define mxdebug(msg) debugging_c::output((boost::format("Debug> %1%:%2%: %3%") % __FILE__ % __LINE__ % (msg)).str())

#define mxdebug_if(condition, msg) \
  if (condition) {                 \
    mxdebug(msg);                  \
  }

#endif  // UMKV_COMMON_DEBUGGING_H
