/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   helper functions for unit tests
*/

#include "common/common_pch.h"

#include "common/fs_sys_helpers.h"
#include "tests/unit/util.h"

namespace umkvut {

temp_dir_c::temp_dir_c()
  : m_path{bfs::temp_directory_path() / bfs::unique_path("unlinkmkv-test-%%%%-%%%%-%%%%")}
{
  umkv::fs::create_directories(m_path);
}

temp_dir_c::~temp_dir_c() {
  boost::system::error_code ec;
  bfs::remove_all(m_path, ec);
}

bfs::path
temp_dir_c::touch(std::string const &name,
                  std::string const &content)
  const
{
  auto file_name = m_path / name;
  umkv::fs::create_directories(file_name.parent_path());
  umkv::fs::write_file(file_name, content);
  return file_name;
}

bfs::path
data_dir() {
#if defined(UMKV_TESTS_DATA_DIR)
  return bfs::path{UMKV_TESTS_DATA_DIR};
#else
  return bfs::path{"tests/unit/data"};
#endif
}

std::string
read_data_file(std::string const &name) {
  return umkv::fs::read_file(data_dir() / name);
}

std::string
build_chapters_xml(std::vector<chapter_spec_t> const &chapters) {
  std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                    "<Chapters>\n"
                    "  <EditionEntry>\n"
                    "    <EditionFlagOrdered>1</EditionFlagOrdered>\n"
                    "    <EditionFlagDefault>1</EditionFlagDefault>\n";

  auto idx = 0u;
  for (auto const &chapter : chapters) {
    xml += "    <ChapterAtom>\n";
    xml += (boost::format("      <ChapterTimeStart>%1%</ChapterTimeStart>\n") % chapter.start).str();
    xml += (boost::format("      <ChapterTimeEnd>%1%</ChapterTimeEnd>\n")     % chapter.end).str();
    xml += (boost::format("      <ChapterFlagEnabled>%1%</ChapterFlagEnabled>\n") % (chapter.enabled ? 1 : 0)).str();
    if (!chapter.segment_uid.empty())
      xml += (boost::format("      <ChapterSegmentUID format=\"hex\">%1%</ChapterSegmentUID>\n") % chapter.segment_uid).str();
    xml += (boost::format("      <ChapterDisplay>\n"
                          "        <ChapterString>Chapter %1%</ChapterString>\n"
                          "      </ChapterDisplay>\n") % ++idx).str();
    xml += "    </ChapterAtom>\n";
  }

  xml += "  </EditionEntry>\n"
         "</Chapters>\n";

  return xml;
}

}
