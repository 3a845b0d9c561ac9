/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   registry of the segments found in a directory
*/

#ifndef UMKV_UNLINK_SEGMENT_REGISTRY_H
#define UMKV_UNLINK_SEGMENT_REGISTRY_H

#include "common/common_pch.h"

#include <exception>

#include "common/timecode.h"

namespace umkv {
namespace unlink {

class tool_chain_c;

class duplicate_segment_x: public umkv::exception {
protected:
  std::string m_segment_uid;
  bfs::path m_first_file, m_second_file;
public:
  duplicate_segment_x(std::string const &segment_uid, bfs::path const &first_file, bfs::path const &second_file)
    : m_segment_uid(segment_uid)
    , m_first_file(first_file)
    , m_second_file(second_file)
  {
  }
  virtual ~duplicate_segment_x() throw() { }

  virtual const char *what() const throw() {
    return "duplicate segment UID";
  }
  virtual std::string error() const throw() {
    return (boost::format(Y("The segment UID %1% is used by both '%2%' and '%3%'.")) % m_segment_uid % m_first_file.string() % m_second_file.string()).str();
  }
};

struct registry_entry_t {
  std::string id;
  bfs::path file_name;
  timecode_c duration;

  registry_entry_t(std::string const &p_id, bfs::path const &p_file_name, timecode_c const &p_duration)
    : id{p_id}
    , file_name{p_file_name}
    , duration{p_duration}
  {
  }
};

class segment_registry_c;
typedef std::shared_ptr<segment_registry_c> segment_registry_cptr;

class segment_registry_c {
protected:
  std::unordered_map<std::string, registry_entry_t> m_entries;

public:
  // Throws duplicate_segment_x if the ID is already known.
  void add(registry_entry_t const &entry);

  // Never resolves to current_file itself.
  boost::optional<registry_entry_t> resolve(std::string const &id, bfs::path const &current_file) const;

  size_t size() const {
    return m_entries.size();
  }

  // Probes all *.mkv files in the directory. Files that cannot be
  // probed are skipped with a warning.
  static segment_registry_cptr build(bfs::path const &directory, tool_chain_c &tool_chain);
};

// Builds each directory's registry once and hands out the same one for
// every later request. A failed build is cached as well.
class segment_registry_cache_c {
protected:
  tool_chain_c &m_tool_chain;
  std::map<bfs::path, segment_registry_cptr> m_registries;
  std::map<bfs::path, std::exception_ptr> m_failures;

public:
  segment_registry_cache_c(tool_chain_c &tool_chain);

  segment_registry_c const &get(bfs::path const &directory);
};

bool same_file(bfs::path const &a, bfs::path const &b);

}}

#endif  // UMKV_UNLINK_SEGMENT_REGISTRY_H
