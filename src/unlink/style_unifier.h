/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   merging of SSA/ASS style catalogs across several scripts
*/

#ifndef UMKV_UNLINK_STYLE_UNIFIER_H
#define UMKV_UNLINK_STYLE_UNIFIER_H

#include "common/common_pch.h"

#include "common/ssa/script.h"

namespace umkv {
namespace unlink {

// "u" followed by the decimal CRC-32 of the file name.
std::string source_tag_for(bfs::path const &file_name);

struct style_entry_t {
  std::string name, definition_line, source_tag;
};

class style_unifier_c {
protected:
  struct file_t {
    bfs::path file_name;
    ssa::script_cptr script;
    ssa::schema_t schema;
    std::string source_tag;
  };

  std::vector<file_t> m_files;
  std::vector<style_entry_t> m_styles;
  boost::optional<unsigned int> m_play_res_x, m_play_res_y;

public:
  style_unifier_c(boost::optional<unsigned int> const &play_res_x = boost::none, boost::optional<unsigned int> const &play_res_y = boost::none);

  void add_file(bfs::path const &file_name);
  void add_script(bfs::path const &file_name, ssa::script_cptr const &script);

  void disambiguate();
  void merge();
  void save() const;

  std::vector<style_entry_t> const &get_styles() const {
    return m_styles;
  }
  ssa::script_c const &get_script(size_t idx) const {
    return *m_files.at(idx).script;
  }

protected:
  void disambiguate_file(file_t &file);
  void merge_file(file_t &file) const;
};

// Loads all files, runs both passes and writes the files back.
void unify_styles(std::vector<bfs::path> const &file_names, boost::optional<unsigned int> const &play_res_x, boost::optional<unsigned int> const &play_res_y);

}}

#endif  // UMKV_UNLINK_STYLE_UNIFIER_H
