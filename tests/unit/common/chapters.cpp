#include "common/common_pch.h"

#include "common/chapters/chapters.h"

#include "tests/unit/util.h"

#include "gtest/gtest.h"

namespace {

using namespace umkv::chapters;

chapters_cptr
load_two_editions() {
  return chapters_c::parse(umkvut::read_data_file("chapters/two_editions.xml"));
}

TEST(Chapters, SegmentUIDNormalizationHex) {
  EXPECT_EQ("5a1b2c3d", segment_uid_c::normalize("0x5a 0x1b 0x2C 0x3d", uf_hex));
  EXPECT_EQ("5a1b2c3d", segment_uid_c::normalize("5A1B\n2C3D", uf_hex));
  EXPECT_EQ("5a1b2c3d", segment_uid_c::normalize("5a 1b\t2c 3d", uf_hex));
}

TEST(Chapters, SegmentUIDNormalizationAscii) {
  EXPECT_EQ("4544",     segment_uid_c::normalize("ED", uf_ascii));
  EXPECT_EQ("00ff",     segment_uid_c::normalize(std::string{"\x00\xff", 2}, uf_ascii));
}

TEST(Chapters, SegmentUIDFromXML) {
  auto uid = segment_uid_c::from_xml(" 0xAB 0xcd ", "hex");
  EXPECT_EQ("abcd", uid.get_id());
  EXPECT_EQ(uf_hex, uid.get_format());

  auto ascii = segment_uid_c::from_xml("AB", "ascii");
  EXPECT_EQ("4142", ascii.get_id());
  EXPECT_EQ(uf_ascii, ascii.get_format());

  EXPECT_EQ(segment_uid_c("abcd"), segment_uid_c::from_xml("ABCD", ""));
  EXPECT_NE(uid, ascii);

  EXPECT_THROW(segment_uid_c::from_xml("  ", "hex"),  malformed_chapters_x);
  EXPECT_THROW(segment_uid_c::from_xml("xyz", "hex"), malformed_chapters_x);
}

TEST(Chapters, ParseEntries) {
  auto chapters = load_two_editions();

  ASSERT_EQ(2u, chapters->num_editions());

  auto entries = chapters->get_entries(1);
  ASSERT_EQ(3u, entries.size());

  EXPECT_EQ(timecode_c::ns(0),  entries[0].get_start());
  EXPECT_EQ(timecode_c::s(90),  entries[0].get_end());
  EXPECT_TRUE(entries[0].is_enabled());
  ASSERT_TRUE(entries[0].has_segment_uid());
  EXPECT_EQ("5a1b2c3d4e5f6071", entries[0].get_segment_uid()->get_id());
  EXPECT_EQ("Opening", entries[0].get_name());

  EXPECT_FALSE(entries[1].has_segment_uid());
  EXPECT_EQ(timecode_c::m(20), entries[1].get_end());

  EXPECT_FALSE(entries[2].is_enabled());
  ASSERT_TRUE(entries[2].has_segment_uid());
  EXPECT_EQ("4544", entries[2].get_segment_uid()->get_id());
  EXPECT_EQ(uf_ascii, entries[2].get_segment_uid()->get_format());

  EXPECT_EQ(1u, chapters->get_entries(2).size());
}

TEST(Chapters, NoSuchEdition) {
  auto chapters = load_two_editions();

  EXPECT_THROW(chapters->get_entries(0),    no_such_edition_x);
  EXPECT_THROW(chapters->get_entries(3),    no_such_edition_x);
  EXPECT_THROW(chapters->select_edition(3), no_such_edition_x);

  try {
    chapters->select_edition(5);
  } catch (no_such_edition_x &ex) {
    EXPECT_EQ(5u, ex.requested());
  }
}

TEST(Chapters, WriteThrough) {
  auto chapters = load_two_editions();
  auto entries  = chapters->get_entries(1);

  entries[0].set_start(timecode_c::s(10));
  entries[0].set_end(timecode_c::m(1) + timecode_c::s(40));
  entries[0].drop_segment_uid();

  auto reread = chapters_c::parse(chapters->serialize())->get_entries(1);
  EXPECT_EQ(timecode_c::s(10),  reread[0].get_start());
  EXPECT_EQ(timecode_c::s(100), reread[0].get_end());
  EXPECT_FALSE(reread[0].has_segment_uid());
  EXPECT_TRUE(reread[2].has_segment_uid());
}

TEST(Chapters, SelectEdition) {
  auto chapters = load_two_editions();

  chapters->select_edition(2);

  ASSERT_EQ(1u, chapters->num_editions());
  EXPECT_EQ("Episode only", chapters->get_entries(1)[0].get_name());
}

TEST(Chapters, DropNonDefaultEditions) {
  auto chapters = load_two_editions();

  EXPECT_EQ(1u, chapters->drop_non_default_editions());
  EXPECT_EQ(1u, chapters->num_editions());
  EXPECT_EQ(0u, chapters->drop_non_default_editions());
  EXPECT_EQ("Opening", chapters->get_entries(1)[0].get_name());
}

TEST(Chapters, ClearOrderedFlag) {
  auto chapters = load_two_editions();

  chapters->clear_ordered_flag();

  EXPECT_EQ(std::string::npos, chapters->serialize().find("EditionFlagOrdered"));
  EXPECT_NE(std::string::npos, chapters->serialize().find("EditionFlagDefault"));
}

TEST(Chapters, HasSegmentLinks) {
  EXPECT_TRUE(load_two_editions()->has_segment_links());
  EXPECT_FALSE(chapters_c::parse(umkvut::build_chapters_xml({ { "00:00:00.000", "00:10:00.000" } }))->has_segment_links());
}

TEST(Chapters, SerializeWithDeclaration) {
  auto serialized = load_two_editions()->serialize();

  EXPECT_TRUE(balg::starts_with(serialized, "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<Chapters>"));
  EXPECT_NE(std::string::npos, serialized.find("\n  <EditionEntry>\n"));
}

TEST(Chapters, SaveAndLoad) {
  umkvut::temp_dir_c dir;
  auto file_name = dir / "chapters.xml";

  load_two_editions()->save(file_name);

  EXPECT_EQ(2u, chapters_c::load(file_name)->num_editions());
}

TEST(Chapters, Malformed) {
  EXPECT_THROW(chapters_c::parse("<Chapters><EditionEntry>"), malformed_chapters_x);
  EXPECT_THROW(chapters_c::parse("<Tags/>"),                  malformed_chapters_x);
  EXPECT_THROW(chapters_c::parse(umkvut::build_chapters_xml({ { "00:00:00.000", "garbage" } }))->get_entries(1), malformed_chapters_x);
}

TEST(Chapters, MalformedEnabledFlag) {
  auto xml = umkvut::build_chapters_xml({ { "00:00:00.000", "00:00:01.000" } });
  balg::replace_all(xml, "<ChapterFlagEnabled>1<", "<ChapterFlagEnabled>maybe<");

  EXPECT_THROW(chapters_c::parse(xml)->get_entries(1), malformed_chapters_x);
}

}
