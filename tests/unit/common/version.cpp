#include "common/common_pch.h"

#include "common/version.h"

#include "gtest/gtest.h"

namespace {

TEST(VersionNumber, ParseProgramOutput) {
  version_number_t old_style{"mkvmerge v8.9.0 ('Father Daughter') 64bit"};
  ASSERT_TRUE(old_style.valid);
  EXPECT_EQ("8.9.0", old_style.to_string());

  version_number_t new_style{"mkvmerge v82.0 ('I'm The Drifter') 64-bit"};
  ASSERT_TRUE(new_style.valid);
  EXPECT_EQ("82.0", new_style.to_string());
}

TEST(VersionNumber, ParsePlain) {
  EXPECT_EQ("6.3.0.1", version_number_t{"6.3.0.1"}.to_string());
  EXPECT_EQ("7.0",     version_number_t{"7.0 build 123"}.to_string());
  EXPECT_FALSE(version_number_t{"mkvmerge: command not found"}.valid);
  EXPECT_FALSE(version_number_t{"42"}.valid);
}

TEST(VersionNumber, Compare) {
  EXPECT_TRUE(version_number_t{"5.9.0"}   < version_number_t{"6.0.0"});
  EXPECT_TRUE(version_number_t{"6.0.0"}   < version_number_t{"6.0.0.1"});
  EXPECT_TRUE(version_number_t{"9.9.9"}   < version_number_t{"82.0"});
  EXPECT_FALSE(version_number_t{"10.0.0"} < version_number_t{"9.9.9"});
  EXPECT_EQ(0, version_number_t{"6.1"}.compare(version_number_t{"6.1.0"}));
}

}
