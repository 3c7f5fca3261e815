#include <gtest/gtest.h>

#include "library/natural_sort.hpp"

#include <string>
#include <vector>

using cue::natural_compare;
using cue::natural_less;
using cue::natural_sort;

TEST(NaturalSortTest, NumbersCompareByValue) {
  std::vector<std::string> names{"ep10.mkv", "ep2.mkv", "ep1.mkv"};
  natural_sort(names);
  EXPECT_EQ(names, (std::vector<std::string>{"ep1.mkv", "ep2.mkv", "ep10.mkv"}));
}

TEST(NaturalSortTest, LeadingZerosDoNotMatter) {
  EXPECT_TRUE(natural_less("ep02.mkv", "ep10.mkv"));
  EXPECT_TRUE(natural_less("ep9.mkv", "ep010.mkv"));
}

TEST(NaturalSortTest, CaseInsensitiveText) {
  std::vector<std::string> names{"b.mkv", "A.mkv", "c.mkv"};
  natural_sort(names);
  EXPECT_EQ(names, (std::vector<std::string>{"A.mkv", "b.mkv", "c.mkv"}));
}

TEST(NaturalSortTest, MultipleNumberRuns) {
  std::vector<std::string> names{"S02E01", "S01E10", "S01E02", "S10E01"};
  natural_sort(names);
  EXPECT_EQ(names, (std::vector<std::string>{"S01E02", "S01E10", "S02E01", "S10E01"}));
}

TEST(NaturalSortTest, IsAStrictOrdering) {
  EXPECT_EQ(natural_compare("ep1", "ep1"), 0);
  EXPECT_FALSE(natural_less("ep1", "ep1"));
  // Distinct strings never compare equal.
  EXPECT_NE(natural_compare("ep01", "ep1"), 0);
  EXPECT_NE(natural_compare("Ep1", "ep1"), 0);
}

TEST(NaturalSortTest, PrefixSortsFirst) {
  EXPECT_TRUE(natural_less("ep", "ep1"));
  EXPECT_TRUE(natural_less("show/ep1", "show/ep1b"));
}
