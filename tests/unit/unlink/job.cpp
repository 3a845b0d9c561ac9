#include "common/common_pch.h"

#include "common/fs_sys_helpers.h"
#include "common/process.h"
#include "unlink/job.h"
#include "unlink/style_unifier.h"

#include "tests/unit/init.h"
#include "tests/unit/unlink/fake_tool_chain.h"
#include "tests/unit/util.h"

#include "gtest/gtest.h"

namespace {

using namespace umkv::unlink;
using umkvut::chapter_spec_t;

class UnlinkJob: public ::testing::Test {
protected:
  umkvut::temp_dir_c m_dir;
  umkvut::fake_tool_chain_c m_tool_chain;
  options_c m_options;
  bfs::path m_episode, m_opening;

  virtual void SetUp() {
    m_options.m_outdir = m_dir / "out";
    m_options.m_tmpdir = m_dir / "tmp";

    m_episode = m_dir.touch("in/episode.mkv");
    m_opening = m_dir.touch("in/opening.mkv");

    m_tool_chain.add_segment(m_episode, "aa01", timecode_c::m(20));
    m_tool_chain.add_segment(m_opening, "bb02", timecode_c::s(90));

    m_tool_chain.set_chapters(m_episode, umkvut::build_chapters_xml({
        chapter_spec_t{"00:00:00.000000000", "00:01:30.000000000", "bb02"},
        chapter_spec_t{"00:00:00.000000000", "00:20:00.000000000"},
      }));
  }
};

TEST_F(UnlinkJob, Converts) {
  segment_registry_cache_c registries{m_tool_chain};
  unlink_job_c job{m_options, m_tool_chain, registries, m_episode, 1};

  auto result = job.run();

  EXPECT_EQ(us_converted,                    result.status);
  EXPECT_EQ(m_dir / "out" / "episode.mkv",   result.output);
  EXPECT_TRUE(bfs::exists(result.output));
  EXPECT_EQ("muxed", umkv::fs::read_file(result.output));

  ASSERT_EQ(1u, m_tool_chain.m_split_points.size());
  EXPECT_EQ(std::vector<timecode_c>{ timecode_c::m(20) }, m_tool_chain.m_split_points[0]);

  ASSERT_EQ(1u, m_tool_chain.m_muxed_parts.size());
  auto const &parts = m_tool_chain.m_muxed_parts[0];
  ASSERT_EQ(2u, parts.size());
  EXPECT_TRUE(same_file(m_opening, parts[0]));
  EXPECT_EQ("split-001.mkv", parts[1].filename().string());

  ASSERT_TRUE(!!m_tool_chain.m_muxed_chapters[0]);
  auto const &chapters = m_tool_chain.m_muxed_chapters_content;
  EXPECT_EQ(std::string::npos, chapters.find("ChapterSegmentUID"));
  EXPECT_EQ(std::string::npos, chapters.find("EditionFlagOrdered"));
  EXPECT_NE(std::string::npos, chapters.find("<ChapterTimeStart>00:01:30.000000000</ChapterTimeStart>"));
  EXPECT_NE(std::string::npos, chapters.find("<ChapterTimeEnd>00:21:30.000000000</ChapterTimeEnd>"));

  EXPECT_FALSE(bfs::exists(job.get_work_dir()));
}

TEST_F(UnlinkJob, RestoresMetadata) {
  m_tool_chain.get_segment(m_episode).title = "Episode 1";

  segment_registry_cache_c registries{m_tool_chain};
  unlink_job_c{m_options, m_tool_chain, registries, m_episode, 1}.run();

  auto const &edits = m_tool_chain.m_metadata;
  ASSERT_EQ(6u, edits.size());

  EXPECT_EQ("info",         edits[0].selector);
  EXPECT_EQ("title",        edits[0].property);
  EXPECT_EQ("Episode 1",    edits[0].value);

  EXPECT_EQ("track:a1",     edits[1].selector);
  EXPECT_EQ("language",     edits[1].property);
  EXPECT_EQ("jpn",          edits[1].value);
  EXPECT_EQ("flag-default", edits[2].property);
  EXPECT_EQ("1",            edits[2].value);

  EXPECT_EQ("track:s1",     edits[3].selector);
  EXPECT_EQ("eng",          edits[3].value);
  EXPECT_EQ("name",         edits[4].property);
  EXPECT_EQ("Full",         edits[4].value);
  EXPECT_EQ("flag-default", edits[5].property);
  EXPECT_EQ("0",            edits[5].value);
}

TEST_F(UnlinkJob, FixesSubtitles) {
  m_options.m_cleanup = false;

  m_tool_chain.set_subtitles(m_opening, { umkvut::read_data_file("ssa/part2.ass") });
  m_tool_chain.add_attachment(m_episode, "font.ttf", "application/x-truetype-font");
  m_tool_chain.add_attachment(m_opening, "font.ttf", "application/x-truetype-font");
  m_tool_chain.add_attachment(m_opening, "logo.png", "image/png");

  segment_registry_cache_c registries{m_tool_chain};
  unlink_job_c job{m_options, m_tool_chain, registries, m_episode, 1};

  EXPECT_EQ(us_converted, job.run().status);

  ASSERT_EQ(1u, m_tool_chain.m_remuxed_parts.size());
  EXPECT_TRUE(same_file(m_opening, m_tool_chain.m_remuxed_parts[0]));
  EXPECT_EQ(2u, m_tool_chain.m_remuxed_attachments[0].size());

  ASSERT_EQ(2u, m_tool_chain.m_extracted_attachments.size());
  EXPECT_EQ("font.ttf", m_tool_chain.m_extracted_attachments[0][0].name);
  ASSERT_EQ(1u,         m_tool_chain.m_extracted_attachments[1].size());
  EXPECT_EQ("logo.png", m_tool_chain.m_extracted_attachments[1][0].name);

  auto const &parts = m_tool_chain.m_muxed_parts[0];
  EXPECT_EQ(job.get_work_dir() / "parts" / "1-fixsubs.mkv", parts[0]);
  EXPECT_EQ("split-001.mkv",                                parts[1].filename().string());

  auto subtitles = job.get_work_dir() / "subtitles" / "1" / "opening.mkv-2.ass";
  ASSERT_TRUE(bfs::exists(subtitles));
  EXPECT_NE(std::string::npos, umkv::fs::read_file(subtitles).find("Style: Tahoma,Default " + source_tag_for(subtitles) + ",22"));

  EXPECT_TRUE(bfs::exists(job.get_work_dir() / "episode-chapters-original.xml"));
  EXPECT_TRUE(bfs::exists(job.get_work_dir() / "episode-chapters.xml"));
}

TEST_F(UnlinkJob, RemuxesTheMergedSubtitles) {
  m_options.m_cleanup = false;
  m_tool_chain.set_subtitles(m_opening, { umkvut::read_data_file("ssa/part2.ass") });

  segment_registry_cache_c registries{m_tool_chain};
  unlink_job_c job{m_options, m_tool_chain, registries, m_episode, 1};

  auto result = job.run();
  EXPECT_EQ(us_converted, result.status);

  ASSERT_EQ(1u, m_tool_chain.m_replaced_subtitles_in.size());
  EXPECT_EQ("episode.mkv", m_tool_chain.m_replaced_subtitles_in[0].filename().string());
  EXPECT_TRUE(bfs::exists(job.get_work_dir() / "subtitles" / "merged" / "episode.mkv-2.ass"));

  EXPECT_EQ("subtitles replaced in episode.mkv", umkv::fs::read_file(result.output));
  EXPECT_EQ(m_dir / "out" / "episode.mkv",       result.output);
}

TEST_F(UnlinkJob, MergedFileWithoutSubtitlesIsKept) {
  segment_registry_cache_c registries{m_tool_chain};
  auto result = unlink_job_c{m_options, m_tool_chain, registries, m_episode, 1}.run();

  EXPECT_TRUE(m_tool_chain.m_replaced_subtitles_in.empty());
  EXPECT_EQ("muxed", umkv::fs::read_file(result.output));
}

TEST_F(UnlinkJob, OptionsDisableSubtitlesAndChapters) {
  m_options.m_fix_subtitles = false;
  m_options.m_chapters      = false;
  m_tool_chain.set_subtitles(m_opening, { umkvut::read_data_file("ssa/part2.ass") });

  segment_registry_cache_c registries{m_tool_chain};
  unlink_job_c{m_options, m_tool_chain, registries, m_episode, 1}.run();

  EXPECT_TRUE(m_tool_chain.m_remuxed_parts.empty());
  EXPECT_TRUE(m_tool_chain.m_replaced_subtitles_in.empty());
  ASSERT_EQ(1u, m_tool_chain.m_muxed_chapters.size());
  EXPECT_FALSE(!!m_tool_chain.m_muxed_chapters[0]);
}

TEST_F(UnlinkJob, NotLinked) {
  segment_registry_cache_c registries{m_tool_chain};

  unlink_job_c job1{m_options, m_tool_chain, registries, m_opening, 1};
  EXPECT_EQ(us_not_linked, job1.run().status);
  EXPECT_FALSE(bfs::exists(job1.get_work_dir()));

  m_tool_chain.set_chapters(m_opening, umkvut::build_chapters_xml({ chapter_spec_t{"00:00:00.000000000", "00:01:30.000000000"} }));

  unlink_job_c job2{m_options, m_tool_chain, registries, m_opening, 2};
  EXPECT_EQ(us_not_linked, job2.run().status);

  EXPECT_TRUE(m_tool_chain.m_muxed_parts.empty());
  EXPECT_FALSE(bfs::exists(m_options.m_outdir));
}

TEST_F(UnlinkJob, MissingSegment) {
  m_tool_chain.set_chapters(m_episode, umkvut::build_chapters_xml({
      chapter_spec_t{"00:00:00.000000000", "00:01:30.000000000", "cc03"},
      chapter_spec_t{"00:00:00.000000000", "00:20:00.000000000"},
    }));

  segment_registry_cache_c registries{m_tool_chain};
  unlink_job_c job{m_options, m_tool_chain, registries, m_episode, 1};

  EXPECT_THROW(job.run(), missing_segment_x);
  EXPECT_FALSE(bfs::exists(job.get_work_dir()));
  EXPECT_TRUE(m_tool_chain.m_muxed_parts.empty());
}

TEST_F(UnlinkJob, TooFewSlices) {
  m_tool_chain.set_chapters(m_episode, umkvut::build_chapters_xml({
      chapter_spec_t{"00:00:00.000000000", "00:10:00.000000000"},
      chapter_spec_t{"00:00:00.000000000", "00:01:30.000000000", "bb02"},
      chapter_spec_t{"00:10:00.000000000", "00:20:00.000000000"},
    }));

  // The second internal run needs a second slice.
  m_tool_chain.m_num_slices_override = 1;

  segment_registry_cache_c registries{m_tool_chain};
  unlink_job_c job{m_options, m_tool_chain, registries, m_episode, 1};

  try {
    job.run();
    FAIL() << "no exception thrown";
  } catch (umkv::process::external_tool_failure_x &ex) {
    EXPECT_NE(std::string::npos, ex.command_line().find("--split timecodes:00:10:00.000000000"));
    EXPECT_NE(std::string::npos, ex.error().find(ex.command_line()));
  }
}

TEST_F(UnlinkJob, DropsNonDefaultEditions) {
  m_tool_chain.add_segment(m_opening, "5a1b2c3d4e5f6071", timecode_c::s(90));
  m_tool_chain.set_chapters(m_episode, umkvut::read_data_file("chapters/two_editions.xml"));

  segment_registry_cache_c registries{m_tool_chain};
  auto result = unlink_job_c{m_options, m_tool_chain, registries, m_episode, 1}.run();

  EXPECT_EQ(us_converted, result.status);
  EXPECT_TRUE(g_warning_issued);
  EXPECT_EQ(std::string::npos, m_tool_chain.m_muxed_chapters_content.find("Episode only"));
  EXPECT_NE(std::string::npos, m_tool_chain.m_muxed_chapters_content.find("Opening"));
}

TEST_F(UnlinkJob, KeepsNonDefaultEditionsWhenAsked) {
  m_options.m_ignore_default_flag = true;
  m_options.m_edition             = 2;
  m_tool_chain.set_chapters(m_episode, umkvut::read_data_file("chapters/two_editions.xml"));

  segment_registry_cache_c registries{m_tool_chain};
  auto result = unlink_job_c{m_options, m_tool_chain, registries, m_episode, 1}.run();

  EXPECT_EQ(us_converted, result.status);
  EXPECT_NE(std::string::npos, m_tool_chain.m_muxed_chapters_content.find("Episode only"));
  EXPECT_EQ(std::string::npos, m_tool_chain.m_muxed_chapters_content.find("Opening"));
}

}
