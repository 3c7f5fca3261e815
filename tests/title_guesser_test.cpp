#include <gtest/gtest.h>

#include "library/title_guesser.hpp"

using cue::clean_title;
using cue::guess_metadata;

TEST(TitleGuesserTest, EpisodeTagGivesSeason) {
  auto metadata = guess_metadata("/media/Show.Name.S02E05.1080p.mkv", false);
  EXPECT_EQ(metadata.clean_title, "Show Name");
  ASSERT_TRUE(metadata.season_number.has_value());
  EXPECT_EQ(*metadata.season_number, 2);
  EXPECT_FALSE(metadata.user_locked_title);
}

TEST(TitleGuesserTest, CrossNotationGivesSeason) {
  auto metadata = guess_metadata("/media/Some_Show_3x07.avi", false);
  EXPECT_EQ(metadata.clean_title, "Some Show");
  ASSERT_TRUE(metadata.season_number.has_value());
  EXPECT_EQ(*metadata.season_number, 3);
}

TEST(TitleGuesserTest, MovieDropsReleaseNoise) {
  auto metadata = guess_metadata("/media/Some_Movie (2010) [x264].mp4", false);
  EXPECT_EQ(metadata.clean_title, "Some Movie");
  EXPECT_FALSE(metadata.season_number.has_value());

  EXPECT_EQ(guess_metadata("/media/Another.Movie.2012.720p.BluRay.mkv", false).clean_title,
            "Another Movie");
}

TEST(TitleGuesserTest, SeasonFolderUsesParentName) {
  auto metadata = guess_metadata("/media/Show Name/Season 3", true);
  EXPECT_EQ(metadata.clean_title, "Show Name");
  ASSERT_TRUE(metadata.season_number.has_value());
  EXPECT_EQ(*metadata.season_number, 3);

  auto trailing = guess_metadata("/media/Show Name/Season 3/", true);
  EXPECT_EQ(trailing.clean_title, "Show Name");
}

TEST(TitleGuesserTest, BareEpisodeFileUsesFolderName) {
  auto metadata = guess_metadata("/media/Great_Show/S01E01.mkv", false);
  EXPECT_EQ(metadata.clean_title, "Great Show");
  EXPECT_EQ(metadata.season_number.value_or(0), 1);
}

TEST(TitleGuesserTest, PlainNameIsKept) {
  auto metadata = guess_metadata("/media/holiday video.mov", false);
  EXPECT_EQ(metadata.clean_title, "holiday video");
  EXPECT_FALSE(metadata.season_number.has_value());
}

TEST(TitleGuesserTest, CleanTitleCollapsesSeparators) {
  EXPECT_EQ(clean_title("a..b__c  d"), "a b c d");
  EXPECT_EQ(clean_title("[Group] Title - "), "Title");
}
