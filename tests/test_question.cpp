#include <gtest/gtest.h>

#include <string>

#include "parley/question.hpp"
#include "parley/template_engine.hpp"

using parley::Question;

TEST(ParseTest, IntegersAcceptRadixPrefixesAndSeparators) {
  EXPECT_EQ(parley::ParseInteger("42"), 42);
  EXPECT_EQ(parley::ParseInteger("  -42 "), -42);
  EXPECT_EQ(parley::ParseInteger("0x1F"), 31);
  EXPECT_EQ(parley::ParseInteger("0b101"), 5);
  EXPECT_EQ(parley::ParseInteger("0o17"), 15);
  EXPECT_EQ(parley::ParseInteger("017"), 15);
  EXPECT_EQ(parley::ParseInteger("1_000"), 1000);
  EXPECT_EQ(parley::ParseInteger("0"), 0);

  EXPECT_FALSE(parley::ParseInteger("").has_value());
  EXPECT_FALSE(parley::ParseInteger("12abc").has_value());
  EXPECT_FALSE(parley::ParseInteger("1__0").has_value());
  EXPECT_FALSE(parley::ParseInteger("_1").has_value());
  EXPECT_FALSE(parley::ParseInteger("09").has_value());
  EXPECT_FALSE(parley::ParseInteger("1.5").has_value());
}

TEST(ParseTest, FloatsAreStrict) {
  EXPECT_DOUBLE_EQ(*parley::ParseFloat("3.5"), 3.5);
  EXPECT_DOUBLE_EQ(*parley::ParseFloat("1e3"), 1000.0);
  EXPECT_DOUBLE_EQ(*parley::ParseFloat("-.5"), -0.5);
  EXPECT_DOUBLE_EQ(*parley::ParseFloat("7"), 7.0);
  EXPECT_DOUBLE_EQ(*parley::ParseFloat("1_000.25"), 1000.25);

  EXPECT_FALSE(parley::ParseFloat("abc").has_value());
  EXPECT_FALSE(parley::ParseFloat("1.2.3").has_value());
  EXPECT_FALSE(parley::ParseFloat("e5").has_value());
  EXPECT_FALSE(parley::ParseFloat(".").has_value());
  EXPECT_FALSE(parley::ParseFloat("").has_value());
}

TEST(QuestionTest, WhitespaceModes) {
  Question q("?");
  EXPECT_EQ(q.RemoveWhitespace("  hi  \n"), "hi");

  q.SetWhitespace(parley::WhitespaceMode::Chomp);
  EXPECT_EQ(q.RemoveWhitespace(" x\r\n"), " x");
  q.SetWhitespace(parley::WhitespaceMode::Collapse);
  EXPECT_EQ(q.RemoveWhitespace("a  \t b"), "a b");
  q.SetWhitespace(parley::WhitespaceMode::StripAndCollapse);
  EXPECT_EQ(q.RemoveWhitespace("  a   b  "), "a b");
  q.SetWhitespace(parley::WhitespaceMode::Remove);
  EXPECT_EQ(q.RemoveWhitespace(" a b\tc "), "abc");
  q.SetWhitespace(parley::WhitespaceMode::None);
  EXPECT_EQ(q.RemoveWhitespace(" a "), " a ");
}

TEST(QuestionTest, CaseModes) {
  Question q("?");
  q.SetCase(parley::CaseMode::Up);
  EXPECT_EQ(q.ChangeCase("MiXed"), "MIXED");
  q.SetCase(parley::CaseMode::Down);
  EXPECT_EQ(q.ChangeCase("MiXed"), "mixed");
  q.SetCase(parley::CaseMode::Capitalize);
  EXPECT_EQ(q.ChangeCase("hELLO"), "Hello");
  EXPECT_EQ(q.Normalize("  wORLD "), "World");
}

TEST(QuestionTest, DefaultMarkerPlacement) {
  Question q("Name?  ");
  q.SetDefault("bob");
  EXPECT_EQ(q.Render(), "Name?  |bob|  ");

  q.SetText("Name?");
  EXPECT_EQ(q.Render(), "Name?  |bob|");

  q.SetText("Name?\n");
  EXPECT_EQ(q.Render(), "Name?  |bob|\n");

  q.SetText("");
  EXPECT_EQ(q.Render(), "|bob|  ");

  Question plain("Plain?  ");
  EXPECT_EQ(plain.Render(), "Plain?  ");
}

TEST(QuestionTest, EmptyAnswerUsesDefault) {
  Question q("?");
  EXPECT_EQ(q.AnswerOrDefault(""), "");
  q.SetDefault("blue");
  EXPECT_EQ(q.AnswerOrDefault(""), "blue");
  EXPECT_EQ(q.AnswerOrDefault("red"), "red");
}

TEST(QuestionTest, RegexValidationSearchesAndWhitelistMatchesExactly) {
  Question q("?");
  EXPECT_TRUE(q.ValidAnswer("anything"));

  q.SetValidate("\\d");
  EXPECT_TRUE(q.ValidAnswer("abc1"));
  EXPECT_FALSE(q.ValidAnswer("abc"));

  Question w("?");
  w.SetWhitelist({"yes", "no"});
  EXPECT_TRUE(w.ValidAnswer("no"));
  EXPECT_FALSE(w.ValidAnswer("nope"));
  EXPECT_EQ(w.Response(parley::ResponseKey::NotValid),
            "Your answer isn't valid (must match one of [\"yes\", \"no\"]).");
}

TEST(QuestionTest, RegexAndWhitelistAreExclusive) {
  Question a("?");
  a.SetValidate("x");
  try {
    a.SetWhitelist({"x"});
    FAIL() << "expected ParleyError";
  } catch (const parley::ParleyError& e) {
    EXPECT_EQ(e.code(), parley::ParleyErrc::InvalidConfiguration);
  }

  Question b("?");
  b.SetWhitelist({"x"});
  EXPECT_THROW(b.SetValidate("x"), parley::ParleyError);

  Question c("?");
  EXPECT_THROW(c.SetValidate("(unclosed"), parley::ParleyError);
}

TEST(QuestionTest, ConvertByAnswerType) {
  Question s("?");
  EXPECT_EQ(s.Convert("text").value.as<std::string>(), "text");

  Question i("?", parley::AnswerType::Integer);
  auto ok = i.Convert("0x10");
  ASSERT_TRUE(ok.ok());
  EXPECT_EQ(ok.value.as<long long>(), 16);
  auto bad = i.Convert("ten");
  ASSERT_FALSE(bad.ok());
  EXPECT_EQ(*bad.error, parley::Recoverable::InvalidType);

  Question f("?", parley::AnswerType::Float);
  EXPECT_DOUBLE_EQ(f.Convert("2.5").value.as<double>(), 2.5);

  Question c("?", std::vector<std::string>{"red", "green", "grey"});
  EXPECT_EQ(c.Convert("red").value.as<std::string>(), "red");
  EXPECT_EQ(*c.Convert("g").error, parley::Recoverable::AmbiguousCompletion);
  EXPECT_EQ(*c.Convert("blue").error, parley::Recoverable::NoCompletion);

  Question custom("?", parley::Converter([](const std::string& s) -> std::optional<parley::Answer> {
    if (s.size() != 3) return std::nullopt;
    return parley::Answer(s + s);
  }));
  EXPECT_EQ(custom.Convert("abc").value.as<std::string>(), "abcabc");
  EXPECT_EQ(*custom.Convert("ab").error, parley::Recoverable::InvalidType);
}

TEST(QuestionTest, CustomTypeWithoutConverterIsFatal) {
  Question q("?", parley::AnswerType::Custom);
  EXPECT_THROW(q.Convert("x"), parley::ParleyError);
}

TEST(QuestionTest, RangeChecks) {
  Question q("?", parley::AnswerType::Integer);
  EXPECT_TRUE(q.InRange(parley::Answer(1000)));

  q.SetAbove(5);
  q.SetBelow(10);
  EXPECT_TRUE(q.InRange(parley::Answer(6)));
  EXPECT_FALSE(q.InRange(parley::Answer(5)));
  EXPECT_FALSE(q.InRange(parley::Answer(10)));
  EXPECT_EQ(q.ExpectedRange(), "above 5 and below 10");

  Question interval("?", parley::AnswerType::Integer);
  interval.SetIn(1, 3);
  EXPECT_TRUE(interval.InRange(parley::Answer(3)));
  EXPECT_FALSE(interval.InRange(parley::Answer(4)));
  EXPECT_EQ(interval.Response(parley::ResponseKey::NotInRange),
            "Your answer isn't within the expected range (included in 1..3).");

  Question set("?");
  set.SetIn(std::vector<std::string>{"a", "b"});
  EXPECT_TRUE(set.InRange(parley::Answer("a")));
  EXPECT_FALSE(set.InRange(parley::Answer("c")));
}

TEST(QuestionTest, DefaultAndCustomResponses) {
  Question q("?", parley::AnswerType::Integer);
  EXPECT_EQ(q.Response(parley::ResponseKey::InvalidType), "You must enter a valid Integer.");
  EXPECT_EQ(q.Response(parley::ResponseKey::AskOnError), "?  ");

  q.SetTypeName("count");
  EXPECT_EQ(q.Response(parley::ResponseKey::InvalidType), "You must enter a valid count.");

  q.SetResponse(parley::ResponseKey::InvalidType, "Digits, please.");
  EXPECT_EQ(q.Response(parley::ResponseKey::InvalidType), "Digits, please.");

  Question c("?", std::vector<std::string>{"x", "y"});
  EXPECT_EQ(c.Response(parley::ResponseKey::NoCompletion), "You must choose one of [\"x\", \"y\"].");
  EXPECT_EQ(c.Response(parley::ResponseKey::AmbiguousCompletion),
            "Ambiguous choice.  Please choose one of [\"x\", \"y\"].");
}

TEST(QuestionTest, GatherSettingsAreExclusive) {
  Question q("?");
  EXPECT_FALSE(q.gathers());
  q.SetGather(size_t{3});
  EXPECT_TRUE(q.gathers());
  EXPECT_EQ(q.gather_count(), 3u);
  q.SetGather(std::string(""));
  EXPECT_EQ(q.gather_count(), 0u);
  ASSERT_TRUE(q.gather_terminator().has_value());
  EXPECT_EQ(*q.gather_terminator(), "");
}

TEST(QuestionTest, FillTemplateExposesQuestionValues) {
  Question q("Pick one", std::vector<std::string>{"x", "y"});
  q.SetDefault("x");
  parley::TemplateContext ctx;
  q.FillTemplate(ctx);
  EXPECT_EQ(parley::ExpandTemplate("<%= question %>|<%= default %>|<%= list(choices, inline) %>", ctx),
            "Pick one|x|x or y");
}
