/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   program options and the configuration file
*/

#ifndef UMKV_UNLINK_OPTIONS_H
#define UMKV_UNLINK_OPTIONS_H

#include "common/common_pch.h"

#include "unlink/mkvtoolnix_tool_chain.h"

namespace umkv {
namespace unlink {

class config_x: public umkv::exception {
protected:
  std::string m_message;
public:
  config_x(std::string const &message)  : m_message(message)       { }
  config_x(boost::format const &message) : m_message(message.str()) { }
  virtual ~config_x() throw() { }

  virtual const char *what() const throw() {
    return m_message.c_str();
  }
};

class options_c {
public:
  bfs::path m_outdir, m_tmpdir;
  tool_paths_t m_tool_paths;
  bool m_fix_subtitles, m_ignore_default_flag, m_ignore_segment_start, m_chapters, m_cleanup;
  size_t m_edition;
  boost::optional<unsigned int> m_play_res_x, m_play_res_y;
  std::vector<bfs::path> m_inputs;

public:
  // Output and temporary directories default to UMKV and UMKV.tmp in
  // the current directory.
  options_c();

  // Sets a configuration value by its configuration file key. Returns
  // false for unknown keys; throws config_x for invalid values.
  bool set(std::string const &key, std::string const &value);

  // Reads "key = value" lines. "$basedir" in values is replaced by
  // base_dir.
  void load_config(bfs::path const &file_name, bfs::path const &base_dir);

  void validate();
  void dump_info() const;
};
typedef std::shared_ptr<options_c> options_cptr;

bfs::path default_config_file();

}}

#endif  // UMKV_UNLINK_OPTIONS_H
