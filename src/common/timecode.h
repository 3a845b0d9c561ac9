/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   nanosecond timestamps that may be unset
*/

#ifndef UMKV_COMMON_TIMECODE_H
#define UMKV_COMMON_TIMECODE_H

#include "common/common_pch.h"

#include <boost/operators.hpp>
#include <stdexcept>

// A point in time or a duration in nanoseconds. A default constructed
// timecode is invalid; arithmetic involving an invalid timecode yields
// an invalid one, and invalid timecodes sort before all valid ones.
// format_timecode() renders the HH:MM:SS.nnnnnnnnn form.
template<typename T>
class basic_timecode_c
  : boost::totally_ordered< basic_timecode_c<T>
  , boost::additive< basic_timecode_c<T>
  > >
{
private:
  boost::optional<T> m_ns;

  static basic_timecode_c<T> scaled(T value, T ns_per_unit) {
    basic_timecode_c<T> result;
    result.m_ns = value * ns_per_unit;
    return result;
  }

  T checked_ns() const {
    if (!m_ns)
      throw std::domain_error{"invalid timecode"};
    return *m_ns;
  }

public:
  static basic_timecode_c<T> ns(T value) { return scaled(value, 1);                }
  static basic_timecode_c<T> us(T value) { return scaled(value, 1000);             }
  static basic_timecode_c<T> ms(T value) { return scaled(value, 1000000);          }
  static basic_timecode_c<T> s(T value)  { return scaled(value, 1000000000);       }
  static basic_timecode_c<T> m(T value)  { return scaled(value, 60 * s(1).to_ns()); }
  static basic_timecode_c<T> h(T value)  { return scaled(value, 60 * m(1).to_ns()); }

  bool valid() const {
    return !!m_ns;
  }

  bool is_zero() const {
    return m_ns && (0 == *m_ns);
  }

  void reset() {
    m_ns = boost::none;
  }

  T to_ns() const {
    return checked_ns();
  }

  T to_ns(T value_if_invalid) const {
    return m_ns ? *m_ns : value_if_invalid;
  }

  T to_ms() const {
    return checked_ns() / 1000000;
  }

  T to_s() const {
    return checked_ns() / 1000000000;
  }

  basic_timecode_c<T> &operator +=(basic_timecode_c<T> const &other) {
    if (m_ns && other.m_ns)
      *m_ns += *other.m_ns;
    else
      reset();
    return *this;
  }

  basic_timecode_c<T> &operator -=(basic_timecode_c<T> const &other) {
    if (m_ns && other.m_ns)
      *m_ns -= *other.m_ns;
    else
      reset();
    return *this;
  }

  bool operator <(basic_timecode_c<T> const &other) const {
    return m_ns < other.m_ns;
  }

  bool operator ==(basic_timecode_c<T> const &other) const {
    return m_ns == other.m_ns;
  }
};

typedef basic_timecode_c<int64_t> timecode_c;

#endif  // UMKV_COMMON_TIMECODE_H
