/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   reading segment information from Matroska files
*/

#ifndef UMKV_UNLINK_KAX_SEGMENT_PROBER_H
#define UMKV_UNLINK_KAX_SEGMENT_PROBER_H

#include "common/common_pch.h"

#include "unlink/segment_info.h"

namespace umkv {
namespace unlink {

class probe_failure_x: public umkv::exception {
protected:
  bfs::path m_file_name;
  std::string m_message;
public:
  probe_failure_x(bfs::path const &file_name, std::string const &message)
    : m_file_name(file_name)
    , m_message(message)
  {
  }
  virtual ~probe_failure_x() throw() { }

  virtual const char *what() const throw() {
    return "probing the Matroska file failed";
  }
  virtual std::string error() const throw() {
    return (boost::format(Y("The file '%1%' could not be read as a Matroska file: %2%")) % m_file_name.string() % m_message).str();
  }
};

// Reads the segment UID, duration, title, track headers and attachment
// list of the first segment. Everything up to and including the first
// cluster of unknown size is examined.
segment_info_t probe_kax_segment(bfs::path const &file_name);

}}

#endif  // UMKV_UNLINK_KAX_SEGMENT_PROBER_H
