#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "parley/completion.hpp"

using parley::Complete;
using Status = parley::CompletionResult::Status;

TEST(CompletionTest, UniquePrefixCompletes) {
  auto r = Complete({"exit", "help", "set"}, "e");
  EXPECT_EQ(r.status, Status::Match);
  EXPECT_EQ(r.value, "exit");
}

TEST(CompletionTest, ExactMatchWinsOverLongerCandidates) {
  auto r = Complete({"helpme", "help"}, "help");
  EXPECT_EQ(r.status, Status::Match);
  EXPECT_EQ(r.value, "help");
}

TEST(CompletionTest, ShortestWinsWhenItPrefixesTheRest) {
  auto r = Complete({"settings", "set"}, "se");
  EXPECT_EQ(r.status, Status::Match);
  EXPECT_EQ(r.value, "set");
  EXPECT_EQ(r.candidates.size(), 2u);
}

TEST(CompletionTest, DivergentMatchesAreAmbiguous) {
  auto r = Complete({"exit", "export", "help"}, "ex");
  EXPECT_EQ(r.status, Status::Ambiguous);
  EXPECT_EQ(r.candidates, (std::vector<std::string>{"exit", "export"}));
}

TEST(CompletionTest, EachWordMayBeAbbreviated) {
  auto r = Complete({"help-faq", "help-index", "history"}, "h-f");
  EXPECT_EQ(r.status, Status::Match);
  EXPECT_EQ(r.value, "help-faq");
}

TEST(CompletionTest, NoMatchAndEmptyKey) {
  EXPECT_EQ(Complete({"exit", "help"}, "z").status, Status::NoMatch);
  EXPECT_EQ(Complete({"exit", "help"}, "").status, Status::NoMatch);
  EXPECT_EQ(Complete({}, "a").status, Status::NoMatch);
}

TEST(CompletionTest, DuplicateCandidatesCountOnce) {
  auto r = Complete({"apple", "apple"}, "ap");
  EXPECT_EQ(r.status, Status::Match);
  EXPECT_EQ(r.value, "apple");
  EXPECT_EQ(r.candidates.size(), 1u);
}

TEST(CompletionTest, RegexCharactersInKeyAreLiteral) {
  EXPECT_EQ(Complete({"a.b", "axb"}, "a.").value, "a.b");
}
