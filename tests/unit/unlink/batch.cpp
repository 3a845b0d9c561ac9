#include "common/common_pch.h"

#include "common/fs_sys_helpers.h"
#include "unlink/batch.h"

#include "tests/unit/init.h"
#include "tests/unit/unlink/fake_tool_chain.h"
#include "tests/unit/util.h"

#include "gtest/gtest.h"

namespace {

using namespace umkv::unlink;
using umkvut::chapter_spec_t;

TEST(Batch, CollectFiles) {
  umkvut::temp_dir_c dir;
  umkvut::fake_tool_chain_c tool_chain;

  dir.touch("in/b.MKV");
  dir.touch("in/a.mkv");
  dir.touch("in/notes.txt");
  dir.touch("in/sub/c.mkv");
  dir.touch("out/a.mkv");
  auto extra = dir.touch("extra/episode.txt");

  options_c options;
  options.m_outdir = dir / "out";
  options.m_inputs = { dir / "in", extra, dir / "in" / "b.MKV", dir / "missing" };

  auto files = batch_c{options, tool_chain}.collect_files();

  EXPECT_TRUE(g_warning_issued);
  ASSERT_EQ(2u, files.size());
  EXPECT_EQ(dir / "extra" / "episode.txt", files[0]);
  EXPECT_EQ(dir / "in" / "b.MKV",          files[1]);
}

class BatchRun: public ::testing::Test {
protected:
  umkvut::temp_dir_c m_dir;
  umkvut::fake_tool_chain_c m_tool_chain;
  options_c m_options;

  virtual void SetUp() {
    m_options.m_outdir = m_dir / "out";
    m_options.m_tmpdir = m_dir / "tmp";
    m_options.m_inputs = { m_dir / "in" };

    auto opening = m_dir.touch("in/opening.mkv");
    auto good    = m_dir.touch("in/good.mkv");

    m_tool_chain.add_segment(opening, "bb02", timecode_c::s(90));
    m_tool_chain.add_segment(good,    "aa01", timecode_c::m(20));
    m_tool_chain.set_chapters(good, umkvut::build_chapters_xml({
        chapter_spec_t{"00:00:00.000000000", "00:01:30.000000000", "bb02"},
        chapter_spec_t{"00:00:00.000000000", "00:20:00.000000000"},
      }));
  }
};

TEST_F(BatchRun, AllFilesSucceed) {
  batch_c batch{m_options, m_tool_chain};

  EXPECT_EQ(0, batch.run());

  auto const &results = batch.get_results();
  ASSERT_EQ(2u, results.size());
  EXPECT_EQ(us_converted,  results[0].status);
  EXPECT_EQ(us_not_linked, results[1].status);

  EXPECT_TRUE(bfs::exists(m_dir / "out" / "good.mkv"));
  EXPECT_FALSE(bfs::exists(m_dir / "out" / "opening.mkv"));
}

TEST_F(BatchRun, FailedFileDoesNotStopTheBatch) {
  auto bad = m_dir.touch("in/bad.mkv");
  m_tool_chain.add_segment(bad, "cc03", timecode_c::m(20));
  m_tool_chain.set_chapters(bad, umkvut::build_chapters_xml({
      chapter_spec_t{"00:00:00.000000000", "00:01:30.000000000", "dd04"},
      chapter_spec_t{"00:00:00.000000000", "00:20:00.000000000"},
    }));

  batch_c batch{m_options, m_tool_chain};

  EXPECT_EQ(2, batch.run());
  EXPECT_TRUE(g_warning_issued);

  auto const &results = batch.get_results();
  ASSERT_EQ(3u, results.size());
  EXPECT_EQ("bad.mkv",     results[0].file_name.filename().string());
  EXPECT_EQ(us_failed,     results[0].status);
  EXPECT_FALSE(results[0].error.empty());
  EXPECT_EQ(us_converted,  results[1].status);
  EXPECT_EQ(us_not_linked, results[2].status);

  EXPECT_TRUE(bfs::exists(m_dir / "out" / "good.mkv"));
  EXPECT_FALSE(bfs::exists(m_dir / "out" / "bad.mkv"));
}

TEST_F(BatchRun, DirectoryIsScannedOnce) {
  auto second = m_dir.touch("in/second.mkv");
  m_tool_chain.add_segment(second, "cc03", timecode_c::m(20));
  m_tool_chain.set_chapters(second, umkvut::build_chapters_xml({
      chapter_spec_t{"00:00:00.000000000", "00:01:30.000000000", "bb02"},
      chapter_spec_t{"00:00:00.000000000", "00:20:00.000000000"},
    }));

  batch_c batch{m_options, m_tool_chain};
  EXPECT_EQ(0, batch.run());

  // Three files for the registry; each converted file is probed for its
  // metadata, then it and the opening are probed for attachments.
  EXPECT_EQ(3u + 2u * 3u, m_tool_chain.m_probed.size());
}

TEST_F(BatchRun, AlreadyConvertedFilesAreSkipped) {
  m_dir.touch("out/good.mkv", "done earlier");

  batch_c batch{m_options, m_tool_chain};
  EXPECT_EQ(0, batch.run());

  ASSERT_EQ(1u, batch.get_results().size());
  EXPECT_EQ(us_not_linked, batch.get_results()[0].status);
  EXPECT_EQ("done earlier", umkv::fs::read_file(m_dir / "out" / "good.mkv"));
}

}
