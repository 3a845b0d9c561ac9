/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   chapter model on top of the Matroska chapter XML format
*/

#ifndef UMKV_COMMON_CHAPTERS_H
#define UMKV_COMMON_CHAPTERS_H

#include "common/common_pch.h"

#include "common/timecode.h"
#include "common/xml/xml.h"

namespace umkv {
namespace chapters {

class exception: public umkv::exception {
public:
  virtual const char *what() const throw() {
    return "generic chapter error";
  }
};

class malformed_chapters_x: public exception {
protected:
  std::string m_message;
public:
  malformed_chapters_x(const std::string &message)  : m_message(message)       { }
  malformed_chapters_x(const boost::format &message): m_message(message.str()) { }
  virtual ~malformed_chapters_x() throw() { }

  virtual const char *what() const throw() {
    return m_message.c_str();
  }
};

class no_such_edition_x: public exception {
protected:
  size_t m_requested, m_available;
public:
  no_such_edition_x(size_t requested, size_t available)
    : m_requested(requested)
    , m_available(available)
  {
  }
  virtual ~no_such_edition_x() throw() { }

  virtual const char *what() const throw() {
    return "no such edition";
  }
  virtual std::string error() const throw() {
    return (boost::format(Y("Edition %1% was requested, but the chapters only contain %2% edition(s).")) % m_requested % m_available).str();
  }
  size_t requested() const {
    return m_requested;
  }
};

enum uid_format_e {
  uf_hex,
  uf_ascii,
};

// A segment identifier in its normalized form: lower-case hex digits
// without separators. The format it was written in is kept as a tag.
class segment_uid_c {
protected:
  std::string m_id;
  uid_format_e m_format;

public:
  segment_uid_c(std::string const &id, uid_format_e format = uf_hex);

  std::string const &get_id() const {
    return m_id;
  }
  uid_format_e get_format() const {
    return m_format;
  }

  bool operator ==(segment_uid_c const &other) const {
    return m_id == other.m_id;
  }
  bool operator !=(segment_uid_c const &other) const {
    return m_id != other.m_id;
  }

  static segment_uid_c from_xml(std::string const &content, std::string const &format_attribute);
  static std::string normalize(std::string const &content, uid_format_e format);
};

std::ostream &operator <<(std::ostream &out, segment_uid_c const &uid);

// One top-level chapter atom. Changes are written through to the XML
// node the entry was created from.
class chapter_entry_c {
protected:
  pugi::xml_node m_node;
  timecode_c m_start, m_end;
  bool m_enabled;
  boost::optional<segment_uid_c> m_segment_uid;

public:
  chapter_entry_c(pugi::xml_node node, timecode_c start, timecode_c end, bool enabled, boost::optional<segment_uid_c> const &segment_uid);

  timecode_c get_start() const {
    return m_start;
  }
  timecode_c get_end() const {
    return m_end;
  }
  bool is_enabled() const {
    return m_enabled;
  }
  boost::optional<segment_uid_c> const &get_segment_uid() const {
    return m_segment_uid;
  }
  bool has_segment_uid() const {
    return !!m_segment_uid;
  }
  std::string get_name() const;

  void set_start(timecode_c const &start);
  void set_end(timecode_c const &end);
  void drop_segment_uid();
};

typedef std::vector<chapter_entry_c> chapter_entries_t;

class chapters_c;
typedef std::shared_ptr<chapters_c> chapters_cptr;

class chapters_c {
protected:
  xml::document_cptr m_doc;

public:
  chapters_c(xml::document_cptr const &doc);

  size_t num_editions() const;
  chapter_entries_t get_entries(size_t edition) const;

  void select_edition(size_t edition);
  size_t drop_non_default_editions();
  void clear_ordered_flag();
  bool has_segment_links() const;

  std::string serialize() const;
  void save(bfs::path const &file_name) const;

  static chapters_cptr parse(std::string const &content);
  static chapters_cptr load(bfs::path const &file_name);

protected:
  pugi::xml_node root() const;
  std::vector<pugi::xml_node> editions() const;
};

}}

#endif  // UMKV_COMMON_CHAPTERS_H
