/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   run code when leaving a scope
*/

#ifndef UMKV_COMMON_AT_SCOPE_EXIT_H
#define UMKV_COMMON_AT_SCOPE_EXIT_H

#include <functional>

// Runs 'code' when the object goes out of scope unless cancel() was
// called before.
class at_scope_exit_c {
private:
  std::function<void()> m_code;

public:
  explicit at_scope_exit_c(std::function<void()> const &code)
    : m_code(code)
  {
  }

  at_scope_exit_c(at_scope_exit_c const &) = delete;
  at_scope_exit_c &operator =(at_scope_exit_c const &) = delete;

  ~at_scope_exit_c() {
    if (m_code)
      m_code();
  }

  void cancel() {
    m_code = nullptr;
  }
};

#endif  // UMKV_COMMON_AT_SCOPE_EXIT_H
