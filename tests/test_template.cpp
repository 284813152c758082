#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "parley/session.hpp"
#include "parley/template_engine.hpp"

namespace {

parley::ParleyErrc ErrorCodeOf(const std::string& text, const parley::TemplateContext& ctx) {
  try {
    parley::ExpandTemplate(text, ctx);
  } catch (const parley::ParleyError& e) {
    return e.code();
  }
  return parley::ParleyErrc::Unknown;
}

}  // namespace

TEST(TemplateTest, PlainTextPassesThrough) {
  parley::TemplateContext ctx;
  EXPECT_EQ(parley::ExpandTemplate("100% plain", ctx), "100% plain");
  EXPECT_EQ(parley::ExpandTemplate("", ctx), "");
}

TEST(TemplateTest, SubstitutesVariables) {
  parley::TemplateContext ctx;
  ctx.Set("name", std::string("World"));
  EXPECT_EQ(parley::ExpandTemplate("Hello <%= name %>!", ctx), "Hello World!");
  EXPECT_EQ(parley::ExpandTemplate("<%=name%><%= name %>", ctx), "WorldWorld");
}

TEST(TemplateTest, NullRendersEmptyAndSequencesJoin) {
  parley::TemplateContext ctx;
  ctx.Set("nothing", YAML::Node());
  YAML::Node seq(YAML::NodeType::Sequence);
  seq.push_back("a");
  seq.push_back("b");
  ctx.Set("items", seq);
  EXPECT_EQ(parley::ExpandTemplate("[<%= nothing %>]", ctx), "[]");
  EXPECT_EQ(parley::ExpandTemplate("<%= items %>", ctx), "a, b");
}

TEST(TemplateTest, CommentsAndEscapes) {
  parley::TemplateContext ctx;
  EXPECT_EQ(parley::ExpandTemplate("a<%# ignored %>b", ctx), "ab");
  EXPECT_EQ(parley::ExpandTemplate("<%%= literal %>", ctx), "<%= literal %>");
}

TEST(TemplateTest, ColorHonoursUseColor) {
  parley::TemplateContext ctx;
  ctx.Set("word", std::string("hi"));
  EXPECT_EQ(parley::ExpandTemplate("<%= color(word, red) %>", ctx), "\x1B[31mhi\x1B[0m");
  EXPECT_EQ(parley::ExpandTemplate("<%= red %>x<%= clear %>", ctx), "\x1B[31mx\x1B[0m");
  EXPECT_EQ(parley::ExpandTemplate("<%= color('lit', bold) %>", ctx), "\x1B[1mlit\x1B[0m");

  ctx.use_color = false;
  EXPECT_EQ(parley::ExpandTemplate("<%= color(word, red) %>", ctx), "hi");
  EXPECT_EQ(parley::ExpandTemplate("<%= red %>x", ctx), "x");
}

TEST(TemplateTest, ListAndCaseFunctions) {
  parley::TemplateContext ctx;
  YAML::Node seq(YAML::NodeType::Sequence);
  seq.push_back("a");
  seq.push_back("b");
  seq.push_back("c");
  ctx.Set("items", seq);
  EXPECT_EQ(parley::ExpandTemplate("<%= list(items, inline) %>", ctx), "a, b or c");
  EXPECT_EQ(parley::ExpandTemplate("<%= list(items, inline, ' and ') %>", ctx), "a, b and c");
  EXPECT_EQ(parley::ExpandTemplate("<%= list(items) %>", ctx), "a\nb\nc\n");
  EXPECT_EQ(parley::ExpandTemplate("<%= upcase('shout') %> <%= downcase(\"QUIET\") %>", ctx),
            "SHOUT quiet");
}

TEST(TemplateTest, ListUsesContextWidth) {
  parley::TemplateContext ctx;
  YAML::Node seq(YAML::NodeType::Sequence);
  for (const std::string s : {"one", "two", "six", "ten"}) seq.push_back(s);
  ctx.Set("items", seq);
  ctx.wrap_at = 10;
  EXPECT_EQ(parley::ExpandTemplate("<%= list(items, columns_across) %>", ctx), "one  two\nsix  ten\n");
}

TEST(TemplateTest, ErrorsAreTemplateErrors) {
  parley::TemplateContext ctx;
  YAML::Node map(YAML::NodeType::Map);
  map["k"] = "v";
  ctx.Set("map", map);

  EXPECT_EQ(ErrorCodeOf("<%= missing %>", ctx), parley::ParleyErrc::Template);
  EXPECT_EQ(ErrorCodeOf("<%= map %>", ctx), parley::ParleyErrc::Template);
  EXPECT_EQ(ErrorCodeOf("<%= unclosed", ctx), parley::ParleyErrc::Template);
  EXPECT_EQ(ErrorCodeOf("<% code %>", ctx), parley::ParleyErrc::Template);
  EXPECT_EQ(ErrorCodeOf("<%= frobnicate(1) %>", ctx), parley::ParleyErrc::Template);
  EXPECT_EQ(ErrorCodeOf("<%= color('x', sparkly) %>", ctx), parley::ParleyErrc::Template);
  EXPECT_EQ(ErrorCodeOf("<%= list('x', diagonal) %>", ctx), parley::ParleyErrc::Template);
  EXPECT_EQ(ErrorCodeOf("<%= 'open %>", ctx), parley::ParleyErrc::Template);
}

TEST(TemplateTest, EscapedTextExpandsToItself) {
  parley::TemplateContext ctx;
  for (const std::string text : {"<%= nope %>", "a <%% b", "<%# hidden %>", "plain", "<%"}) {
    EXPECT_EQ(parley::ExpandTemplate(parley::EscapeTags(text), ctx), text);
  }
  EXPECT_EQ(parley::EscapeTags("x <%= y %>"), "x <%%= y %>");
}

TEST(SessionSayTest, EscapedUserTextIsNotExpanded) {
  std::istringstream in;
  std::ostringstream out;
  parley::Session session(in, out);
  session.Say("You typed " + parley::EscapeTags("<%= missing %>"));
  EXPECT_EQ(out.str(), "You typed <%= missing %>\n");
}
