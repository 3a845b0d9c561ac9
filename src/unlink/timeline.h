/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   reconstruction of a linear timeline from linked chapters
*/

#ifndef UMKV_UNLINK_TIMELINE_H
#define UMKV_UNLINK_TIMELINE_H

#include "common/common_pch.h"

#include <functional>

#include "common/chapters/chapters.h"
#include "common/timecode.h"
#include "unlink/segment_registry.h"
#include "unlink/tool_chain.h"

namespace umkv {
namespace unlink {

class missing_segment_x: public umkv::exception {
protected:
  std::string m_segment_uid;
  size_t m_chapter_index;
public:
  missing_segment_x(std::string const &segment_uid, size_t chapter_index)
    : m_segment_uid(segment_uid)
    , m_chapter_index(chapter_index)
  {
  }
  virtual ~missing_segment_x() throw() { }

  virtual const char *what() const throw() {
    return "linked segment not found";
  }
  virtual std::string error() const throw() {
    return (boost::format(Y("Chapter %1% references the segment %2% which was not found in any other file of the directory.")) % m_chapter_index % m_segment_uid).str();
  }
  std::string const &segment_uid() const {
    return m_segment_uid;
  }
};

enum step_kind_e {
  sk_internal,
  sk_new_external,
  sk_continuation,
};

// What happened to one chapter during the walk.
struct step_t {
  step_kind_e kind;
  size_t chapter_index;
  timecode_c original_start, original_end, start, end;
  boost::optional<registry_entry_t> external;

  step_t()
    : kind{sk_internal}
    , chapter_index{}
  {
  }
};

struct timeline_state_t {
  timecode_c offset, timeline_end, last_internal_end, run_start, run_end, last_split_point;
  boost::optional<std::string> last_external_id;
  bool external_seen, internal_run_after_external;
  size_t chapter_index;

  timeline_state_t();
};

struct step_result_t {
  timeline_state_t state;
  step_t step;
  boost::optional<timecode_c> split_point;
};

typedef std::function<boost::optional<registry_entry_t>(std::string const &)> segment_resolver_t;

// One step of the fold over the chapters of an edition. Throws
// missing_segment_x if a new external reference cannot be resolved.
step_result_t timeline_step(timeline_state_t const &state, chapters::chapter_entry_c const &chapter, segment_resolver_t const &resolve);

// Closes an internal run that followed external content.
boost::optional<timecode_c> timeline_finish(timeline_state_t const &state);

struct timeline_t {
  std::vector<step_t> steps;
  std::vector<timecode_c> split_points;
  timecode_c offset;

  bool has_external_references() const;
};

// Walks the edition, rewrites chapter start and end times, removes the
// segment references, keeps only the chosen edition and removes the
// ordered flag.
timeline_t build_timeline(chapters::chapters_c &chapters, size_t edition, segment_resolver_t const &resolve);

class part_c {
public:
  enum kind_e {
    k_external,
    k_internal,
  };

protected:
  kind_e m_kind;
  bfs::path m_file_name;
  boost::optional<size_t> m_split_index;

public:
  part_c(kind_e kind, bfs::path const &file_name, boost::optional<size_t> const &split_index = boost::none)
    : m_kind(kind)
    , m_file_name(file_name)
    , m_split_index(split_index)
  {
  }

  kind_e get_kind() const {
    return m_kind;
  }
  bfs::path const &get_file_name() const {
    return m_file_name;
  }
  // 1-based index of the slice; unset for the whole original file.
  boost::optional<size_t> const &get_split_index() const {
    return m_split_index;
  }
};

// Second pass: maps the recorded steps onto the slices the original
// file was split into (or the original file if it wasn't split). An
// external reference is only emitted if its chapter starts within the
// first second of the segment, unless 'ignore_segment_start' is set.
// Throws umkv::process::external_tool_failure_x naming the split
// command if a slice is missing.
std::vector<part_c> assign_parts(std::vector<step_t> const &steps, boost::optional<split_result_t> const &split, bfs::path const &original_file, bool ignore_segment_start);

}}

#endif  // UMKV_UNLINK_TIMELINE_H
