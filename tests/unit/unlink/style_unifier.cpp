#include "common/common_pch.h"

#include "common/fs_sys_helpers.h"
#include "unlink/style_unifier.h"

#include "tests/unit/init.h"
#include "tests/unit/util.h"

#include "gtest/gtest.h"

namespace {

using namespace umkv::unlink;
namespace ssa = umkv::ssa;

ssa::script_cptr
load_script(std::string const &name) {
  return ssa::script_c::parse(umkvut::read_data_file("ssa/" + name));
}

std::vector<std::string>
style_lines(ssa::script_c const &script) {
  std::vector<std::string> lines;
  for (auto const &line : script.m_lines)
    if (ssa::line_has_key(line.content, "Style"))
      lines.push_back(line.content);
  return lines;
}

std::vector<std::string>
lines_with_key(ssa::script_c const &script,
               char const *key) {
  std::vector<std::string> lines;
  for (auto const &line : script.m_lines)
    if (ssa::line_has_key(line.content, key))
      lines.push_back(line.content);
  return lines;
}

TEST(StyleUnifier, SourceTag) {
  EXPECT_EQ("u3421780262", source_tag_for("123456789"));
  EXPECT_NE(source_tag_for("part1.ass"), source_tag_for("part2.ass"));
}

TEST(StyleUnifier, DisambiguateRenamesStylesAndReferences) {
  style_unifier_c unifier;
  unifier.add_script("part1.ass", load_script("part1.ass"));
  unifier.add_script("part2.ass", load_script("part2.ass"));

  EXPECT_FALSE(g_warning_issued);

  unifier.disambiguate();

  auto tag1 = source_tag_for("part1.ass");
  auto tag2 = source_tag_for("part2.ass");

  auto const &styles = unifier.get_styles();
  ASSERT_EQ(3u, styles.size());
  EXPECT_EQ("Default " + tag1, styles[0].name);
  EXPECT_EQ("Sign "    + tag1, styles[1].name);
  EXPECT_EQ("Default " + tag2, styles[2].name);
  EXPECT_EQ(tag2,              styles[2].source_tag);
  EXPECT_EQ("Style: Default " + tag1 + ",Arial,20,&H00FFFFFF,0", styles[0].definition_line);
  EXPECT_EQ("Style: Tahoma,Default " + tag2 + ",22",             styles[2].definition_line);

  auto dialogue = lines_with_key(unifier.get_script(0), "Dialogue");
  ASSERT_EQ(1u, dialogue.size());
  EXPECT_EQ("Dialogue: 0,0:00:01.00,0:00:02.00,Default " + tag1 + ",,0,0,0,,Hello, world, again", dialogue[0]);

  auto comment = lines_with_key(unifier.get_script(0), "Comment");
  ASSERT_EQ(1u, comment.size());
  EXPECT_EQ("Comment: 0,0:00:03.00,0:00:04.00,Sign " + tag1 + ",,0,0,0,,Note", comment[0]);

  auto dialogue2 = lines_with_key(unifier.get_script(1), "Dialogue");
  ASSERT_EQ(1u, dialogue2.size());
  EXPECT_EQ("Dialogue: 0,0:00:05.00,0:00:06.00,Default " + tag2 + ",Bye, then", dialogue2[0]);
}

TEST(StyleUnifier, MergeGivesEveryFileAllStyles) {
  style_unifier_c unifier;
  unifier.add_script("part1.ass", load_script("part1.ass"));
  unifier.add_script("part2.ass", load_script("part2.ass"));

  unifier.disambiguate();
  unifier.merge();

  auto styles1 = style_lines(unifier.get_script(0));
  auto styles2 = style_lines(unifier.get_script(1));

  ASSERT_EQ(3u, styles1.size());
  EXPECT_EQ(styles1, styles2);

  // The styles follow the Format: line and keep the file's line endings.
  auto const &lines = unifier.get_script(0).m_lines;
  auto format       = std::find_if(lines.begin(), lines.end(), [](ssa::line_t const &line) { return line.content == "Format: Name, Fontname, Fontsize, PrimaryColour, Bold"; });
  ASSERT_TRUE(format != lines.end());
  ASSERT_TRUE((lines.end() - format) > 3);
  EXPECT_EQ(styles1[0], (format + 1)->content);
  EXPECT_EQ("\r\n",     (format + 3)->terminator);

  EXPECT_TRUE(unifier.get_script(0).has_bom());
  EXPECT_EQ(std::string{"\xef\xbb\xbf[Script Info]\r\n"}, unifier.get_script(0).serialize().substr(0, 18));

  auto serialized2 = unifier.get_script(1).serialize();
  EXPECT_EQ(std::string::npos, serialized2.find('\r'));
  EXPECT_NE(std::string::npos, serialized2.find("PlayResX: 1280\n"));
}

TEST(StyleUnifier, PlayResOverride) {
  style_unifier_c unifier{1920u, 1080u};
  unifier.add_script("part1.ass", load_script("part1.ass"));
  unifier.add_script("part2.ass", load_script("part2.ass"));

  unifier.disambiguate();
  unifier.merge();

  EXPECT_EQ(std::vector<std::string>{ "PlayResX: 1920" }, lines_with_key(unifier.get_script(0), "PlayResX"));
  EXPECT_EQ(std::vector<std::string>{ "PlayResY: 1080" }, lines_with_key(unifier.get_script(0), "PlayResY"));
  EXPECT_EQ(std::vector<std::string>{ "PlayResX: 1920" }, lines_with_key(unifier.get_script(1), "PlayResX"));
  EXPECT_TRUE(lines_with_key(unifier.get_script(1), "PlayResY").empty());
}

TEST(StyleUnifier, ScriptWithoutFormatLinesIsLeftAlone) {
  auto original = umkvut::read_data_file("ssa/no_format.ass");

  style_unifier_c unifier;
  unifier.add_script("part1.ass",     load_script("part1.ass"));
  unifier.add_script("no_format.ass", ssa::script_c::parse(original));

  EXPECT_TRUE(g_warning_issued);

  unifier.disambiguate();
  unifier.merge();

  EXPECT_EQ(original, unifier.get_script(1).serialize());
  EXPECT_EQ(2u,       unifier.get_styles().size());
  EXPECT_EQ(2u,       style_lines(unifier.get_script(0)).size());
}

TEST(StyleUnifier, ScriptWithoutEventsFormatIsLeftAlone) {
  auto original = std::string{
    "[V4+ Styles]\n"
    "Format: Name, Fontname, Fontsize\n"
    "Style: Default,Arial,20\n"
    "\n"
    "[Events]\n"
    "Dialogue: 0,0:00:01.00,0:00:02.00,Default,,0,0,0,,Text\n"
  };

  style_unifier_c unifier;
  unifier.add_script("part1.ass",       load_script("part1.ass"));
  unifier.add_script("styles_only.ass", ssa::script_c::parse(original));

  EXPECT_TRUE(g_warning_issued);

  unifier.disambiguate();
  unifier.merge();

  EXPECT_EQ(original, unifier.get_script(1).serialize());
  EXPECT_EQ(2u,       unifier.get_styles().size());
  EXPECT_EQ(2u,       style_lines(unifier.get_script(0)).size());
}

TEST(StyleUnifier, UnifyFiles) {
  umkvut::temp_dir_c dir;
  auto file1 = dir.touch("1/track.ass", umkvut::read_data_file("ssa/part1.ass"));
  auto file2 = dir.touch("2/track.ass", umkvut::read_data_file("ssa/part2.ass"));

  unify_styles({ file1, file2 }, boost::none, boost::none);

  auto content1 = umkv::fs::read_file(file1);
  auto content2 = umkv::fs::read_file(file2);
  auto tag1     = source_tag_for(file1);
  auto tag2     = source_tag_for(file2);

  for (auto const &content : { content1, content2 }) {
    EXPECT_NE(std::string::npos, content.find("Style: Default " + tag1 + ",Arial"));
    EXPECT_NE(std::string::npos, content.find("Style: Sign "    + tag1 + ",Verdana"));
    EXPECT_NE(std::string::npos, content.find("Style: Tahoma,Default " + tag2 + ",22"));
  }

  EXPECT_NE(std::string::npos, content1.find(",Default " + tag1 + ",,0,0,0,,Hello"));
  EXPECT_NE(std::string::npos, content2.find(",Default " + tag2 + ",Bye"));
}

}
