// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include <cctype>
#include <filesystem>
#include <memory>
#include <map>
#include <string>

#include <gtest/gtest.h>

#include "dom/node.hpp"
#include "dom/parser.hpp"
#include "expr/context.hpp"
#include "expr/exceptions.hpp"
#include "expr/typed_value.hpp"
#include "templating/exceptions.hpp"
#include "templating/expander.hpp"
#include "templating/loader.hpp"

using trellis::expr::Context;
using trellis::expr::TypedValue;
using namespace trellis::templating;
namespace dom = trellis::dom;

namespace {

class TemplateExpanderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    context.Set("name", TypedValue("Ana"));
    context.Set("items", TypedValue(TypedValue::TList{TypedValue("a"), TypedValue("b")}));
    context.Set("empty", TypedValue(TypedValue::TList{}));

    translators.emplace("shout", [](std::string_view inner_source, const dom::Attributes &attributes) {
      std::string text(inner_source);
      for (auto &c : text) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      auto strong = std::make_unique<dom::Element>("strong", attributes);
      strong->AppendChild(std::make_unique<dom::Text>(std::move(text)));
      return EmbeddedTagResult{.node = std::move(strong), .scan_for_template_content = false};
    });
    translators.emplace("literal", [](std::string_view inner_source, const dom::Attributes &) {
      return EmbeddedTagResult{.node = std::make_unique<dom::Text>(std::string(inner_source))};
    });
    translators.emplace("verbatim", [](std::string_view inner_source, const dom::Attributes &) {
      return EmbeddedTagResult{.node = std::make_unique<dom::Text>(std::string(inner_source)),
                               .scan_for_template_content = false};
    });
    translators.emplace("markup", [](std::string_view inner_source, const dom::Attributes &) {
      return EmbeddedTagResult{.node = dom::ParseHtmlFragment(inner_source)};
    });
    translators.emplace("drop", [](std::string_view, const dom::Attributes &) { return EmbeddedTagResult{}; });
  }

  // Expands `html` wrapped in a root element and returns the root's content.
  std::string Expand(std::string_view html) {
    auto document = expander.ParseTemplate("test.html", html, true);
    expander.Expand(*document.root(), context);
    return document.root()->InnerHtml();
  }

  MemoryTemplateLoader loader;
  EmbeddedTagTranslators translators;
  Expander expander{loader, translators};
  Context context;
};

TEST_F(TemplateExpanderTest, PlainMarkupIsUnchanged) {
  const std::string html = "<div class=\"a\" data-x=\"1\"><p>text &amp; more</p><br></div>";
  EXPECT_EQ(Expand(html), html);
}

TEST_F(TemplateExpanderTest, TextMarkersAreEscaped) {
  context.Set("html", TypedValue("<b>bold</b>"));
  EXPECT_EQ(Expand("<p>Hi <%= name %>, <%= html %></p>"), "<p>Hi Ana, &lt;b&gt;bold&lt;/b&gt;</p>");
}

TEST_F(TemplateExpanderTest, AttributeMarkers) {
  context.Set("id", TypedValue(7));
  EXPECT_EQ(Expand(R"(<a href="/users/<%= id %>?n=<%= name %>" title="<%= 'x' + 1 %>">x</a>)"),
            R"(<a href="/users/7?n=Ana" title="x1">x</a>)");
}

TEST_F(TemplateExpanderTest, RawHtmlMarkers) {
  context.Set("html", TypedValue("<b>bold</b>"));
  auto node = std::make_unique<dom::Element>("em");
  node->AppendChild(std::make_unique<dom::Text>("node"));
  context.Set("node", TypedValue::OwnNode(std::move(node)));
  EXPECT_EQ(Expand("<p><%=HTML html %> <%=HTML node %></p>"), "<p><b>bold</b> <em>node</em></p>");
}

TEST_F(TemplateExpanderTest, CodeBlocksRunAndVanish) {
  EXPECT_EQ(Expand("<% var total = items.length * 2 %><p><%= total %></p>"), "<p>4</p>");
  EXPECT_EQ(context.Get("total").ValueInt(), 4);
}

TEST_F(TemplateExpanderTest, IfTrueAndOrElse) {
  context.Set("flag", TypedValue(true));
  EXPECT_EQ(Expand("<if-true cond=\"flag\">yes <%= name %></if-true> <or-else>no</or-else>"), "yes Ana ");
  context.Set("flag", TypedValue(false));
  EXPECT_EQ(Expand("<if-true cond=\"flag\">yes</if-true> <or-else>no</or-else>"), " no");
}

TEST_F(TemplateExpanderTest, OrElsePairsWithLastConditional) {
  context.Set("a", TypedValue(false));
  context.Set("b", TypedValue(true));
  EXPECT_EQ(Expand("<if-true cond=\"a\">A</if-true><p>between</p><or-else>not A</or-else>"
                   "<if-true cond=\"b\">B</if-true><or-else>not B</or-else>"),
            "<p>between</p>not AB");
  EXPECT_EQ(Expand("<or-else>nothing before</or-else>"), "nothing before");
}

TEST_F(TemplateExpanderTest, ConditionalOutcomeIsPerSiblingList) {
  // The if-true nested in the div does not pair with the or-else outside it.
  EXPECT_EQ(Expand("<if-true cond=\"false\">x</if-true><div><if-true cond=\"true\">in</if-true></div>"
                   "<or-else>out</or-else>"),
            "<div>in</div>out");
}

TEST_F(TemplateExpanderTest, ForEach) {
  EXPECT_EQ(Expand("<ul><for-each over=\"items\" as=\"item\" index=\"i\"><li id=\"i<%= i %>\"><%= i %>:<%= item %></li>"
                   "</for-each></ul>"),
            "<ul><li id=\"i0\">0:a</li><li id=\"i1\">1:b</li></ul>");
}

TEST_F(TemplateExpanderTest, ForEachOverMap) {
  context.Set("prices", TypedValue(TypedValue::TMap{{"tea", TypedValue(2)}, {"cake", TypedValue(3.5)}}));
  EXPECT_EQ(Expand("<for-each over=\"prices\" as=\"price\" index=\"what\"><%= what %>=<%= price %>;</for-each>"),
            "tea=2;cake=3.5;");
}

TEST_F(TemplateExpanderTest, EmptyForEachFallsThroughToOrElse) {
  EXPECT_EQ(Expand("<for-each over=\"empty\" as=\"x\"><%= x %></for-each><or-else>none</or-else>"), "none");
  EXPECT_EQ(Expand("<for-each over=\"null\" as=\"x\"><%= x %></for-each><or-else>none</or-else>"), "none");
  EXPECT_EQ(Expand("<for-each over=\"items\" as=\"x\"><%= x %></for-each><or-else>none</or-else>"), "ab");
}

TEST_F(TemplateExpanderTest, LoopVariablesDoNotLeak) {
  context.Set("item", TypedValue("outer"));
  EXPECT_EQ(Expand("<for-each over=\"items\" as=\"item\" index=\"i\"><% var inner = item %><%= item %>"
                   "</for-each>|<%= item %>"),
            "ab|outer");
  EXPECT_FALSE(context.Contains("i"));
  EXPECT_FALSE(context.Contains("inner"));
}

TEST_F(TemplateExpanderTest, NestedLoopsAndConditionals) {
  context.Set("rows", TypedValue(TypedValue::TList{TypedValue(TypedValue::TList{TypedValue(1), TypedValue(2)}),
                                                   TypedValue(TypedValue::TList{})}));
  EXPECT_EQ(Expand("<for-each over=\"rows\" as=\"row\"><tr><for-each over=\"row\" as=\"cell\">"
                   "<if-true cond=\"cell > 1\"><td><%= cell %></td></if-true><or-else><td>-</td></or-else>"
                   "</for-each><or-else><td>empty</td></or-else></tr></for-each>"),
            "<tr><td>-</td><td>2</td></tr><tr><td>empty</td></tr>");
}

TEST_F(TemplateExpanderTest, RenderTemplate) {
  loader.Add("row.html", "<b><%= data.label %></b> for <%= name %>");
  EXPECT_EQ(Expand(R"(<p><render-template file="row.html" data='{"label": "Hi"}'/></p>)"), "<p><b>Hi</b> for Ana</p>");
}

TEST_F(TemplateExpanderTest, RenderTemplateDataIsScoped) {
  context.Set("data", TypedValue(TypedValue::TMap{{"label", TypedValue("outer")}}));
  loader.Add("row.html", "<% var local = 1 %><%= data.label %>");
  EXPECT_EQ(Expand(R"(<render-template file="row.html" data='{"label": "inner"}'/>|<%= data.label %>)"),
            "inner|outer");
  EXPECT_FALSE(context.Contains("local"));
  // Without a data attribute the partial sees the caller's data.
  EXPECT_EQ(Expand(R"(<render-template file="row.html"></render-template>)"), "outer");
}

TEST_F(TemplateExpanderTest, RenderTemplateAnnotations) {
  Expander annotating(loader, translators, true);
  loader.Add("part.html", "<i>p</i>");
  auto document = annotating.ParseTemplate("test.html", "<render-template file=\"part.html\"/>", true);
  annotating.Expand(*document.root(), context);
  EXPECT_EQ(document.root()->InnerHtml(), "<!-- part.html --><i>p</i><!-- end part.html -->");
}

TEST_F(TemplateExpanderTest, RenderTemplateErrors) {
  EXPECT_THROW(Expand("<render-template file=\"missing.html\"/>"), MissingTemplateException);
  loader.Add("row.html", "x");
  EXPECT_THROW(Expand("<render-template file=\"row.html\" data=\"{oops\"/>"), MalformedTemplateException);
  loader.Add("broken.html", "<div>");
  EXPECT_THROW(Expand("<render-template file=\"broken.html\"/>"), MalformedTemplateException);
}

TEST_F(TemplateExpanderTest, HiddenFormData) {
  context.Set("user", TypedValue(TypedValue::TMap{{"id", TypedValue(5)}, {"tags", TypedValue(TypedValue::TList{TypedValue("x")})}}));
  EXPECT_EQ(Expand("<form><hidden-form-data from=\"user\" name=\"user\"/></form>"),
            "<form><input type=\"hidden\" name=\"user\" value=\"\">"
            "<input type=\"hidden\" name=\"user[id]\" value=\"5\">"
            "<input type=\"hidden\" name=\"user[tags]\" value=\"\">"
            "<input type=\"hidden\" name=\"user[tags][0]\" value=\"x\"></form>");
}

TEST_F(TemplateExpanderTest, ScriptMarkersBecomeJson) {
  context.Set("config", TypedValue(TypedValue::TMap{{"end", TypedValue("</script>")}, {"n", TypedValue(1)}}));
  EXPECT_EQ(Expand("<script>var config = <%= config %>; var who = <%= name %>; if (a < b) {}</script>"),
            R"(<script>var config = {"end":"<\/script>","n":1}; var who = "Ana"; if (a < b) {}</script>)");
  EXPECT_EQ(Expand("<script src=\"/<%= name %>.js\"></script>"), "<script src=\"/Ana.js\"></script>");
}

TEST_F(TemplateExpanderTest, UnclosedMarkers) {
  EXPECT_THROW(Expand("<script>var x = <%= name;</script>"), MalformedTemplateException);
  EXPECT_THROW(expander.ParseTemplate("test.html", "<p><%= name </p>", true), MalformedTemplateException);
  EXPECT_THROW(expander.SubstituteMarkers("a <%= name", context), MalformedTemplateException);
}

TEST_F(TemplateExpanderTest, SubstituteMarkers) {
  EXPECT_EQ(expander.SubstituteMarkers("plain", context), "plain");
  EXPECT_EQ(expander.SubstituteMarkers("<%= name %><%= 1 + 1 %>!", context), "Ana2!");
}

TEST_F(TemplateExpanderTest, EmbeddedTagTranslators) {
  EXPECT_EQ(Expand("<shout class=\"x\">hi <%= name %> <b></shout>"), "<strong class=\"x\">HI &lt;%= NAME %&gt; &lt;B&gt;</strong>");
  EXPECT_EQ(Expand("<literal>Hello <%= name %></literal>"), "Hello Ana");
  EXPECT_EQ(Expand("<verbatim>Hello <%= name %></verbatim>"), "Hello &lt;%= name %&gt;");
  EXPECT_EQ(Expand("<markup><if-true cond=\"true\"><i><%= name %></i></if-true></markup>"), "<i>Ana</i>");
  EXPECT_EQ(Expand("a<drop>anything</drop>b"), "ab");
}

TEST_F(TemplateExpanderTest, OnRender) {
  EXPECT_EQ(Expand("<div onrender=\"this.addClass('ready'); this.setAttribute('data-n', name)\"><%= name %></div>"),
            "<div class=\"ready\" data-n=\"Ana\">Ana</div>");
  EXPECT_FALSE(context.Contains("this"));
}

TEST_F(TemplateExpanderTest, OnRenderPopulateForm) {
  context.Set("values", TypedValue(TypedValue::TMap{{"title", TypedValue("T")}, {"extra", TypedValue(1)}}));
  EXPECT_EQ(Expand("<form onrender=\"this.populateFrom(values)\"><input name=\"title\"></form>"),
            "<form><input name=\"title\" value=\"T\"><input type=\"hidden\" name=\"extra\" value=\"1\"></form>");
  // Only forms are populated.
  EXPECT_EQ(Expand("<div onrender=\"this.populateFrom(values)\"></div>"), "<div></div>");
}

TEST_F(TemplateExpanderTest, ExpansionIsIdempotent) {
  context.Set("flag", TypedValue(false));
  auto document = expander.ParseTemplate(
      "test.html",
      "<h1 title=\"<%= name %>\"><%= name %></h1><for-each over=\"items\" as=\"x\"><i><%= x %></i></for-each>"
      "<if-true cond=\"flag\">no</if-true><or-else><p onrender=\"this.addClass('c')\">else</p></or-else>",
      true);
  expander.Expand(*document.root(), context);
  auto once = document.root()->InnerHtml();
  expander.Expand(*document.root(), context);
  EXPECT_EQ(document.root()->InnerHtml(), once);
  EXPECT_EQ(once, "<h1 title=\"Ana\">Ana</h1><i>a</i><i>b</i><p class=\"c\">else</p>");
}

TEST_F(TemplateExpanderTest, EvaluationErrorsPropagate) {
  EXPECT_THROW(Expand("<p><%= missing %></p>"), trellis::expr::UnboundVariableError);
  EXPECT_THROW(Expand("<for-each over=\"name\" as=\"x\"></for-each>"), trellis::expr::TypedValueException);
  EXPECT_THROW(Expand("<if-true cond=\"(\"></if-true>"), trellis::expr::SyntaxException);
}

TEST(TemplateExpander, OwnsItsTranslators) {
  MemoryTemplateLoader loader;
  Context context;
  auto expand = [&](const Expander &expander, std::string_view html) {
    auto document = expander.ParseTemplate("test.html", html, true);
    expander.Expand(*document.root(), context);
    return document.root()->InnerHtml();
  };

  Expander without_translators(loader, {});
  EXPECT_EQ(expand(without_translators, "<p><b>x</b></p>"), "<p><b>x</b></p>");

  Expander with_translators(loader, EmbeddedTagTranslators{
                                        {"hr-tag", [](std::string_view, const dom::Attributes &) {
                                           return EmbeddedTagResult{.node = std::make_unique<dom::Element>("hr")};
                                         }}});
  EXPECT_EQ(expand(with_translators, "a<hr-tag>ignored</hr-tag>b"), "a<hr>b");
}

TEST(TemplateLoader, MemoryLoader) {
  MemoryTemplateLoader loader(std::map<std::string, std::string, std::less<>>{{"a.html", "<p>a</p>"}});
  EXPECT_EQ(loader.LoadTemplateHtml("a.html"), "<p>a</p>");
  loader.Add("a.html", "<p>b</p>");
  EXPECT_EQ(loader.LoadTemplateHtml("a.html"), "<p>b</p>");
  EXPECT_THROW(loader.LoadTemplateHtml("b.html"), MissingTemplateException);
}

TEST(TemplateLoader, DirectoryLoader) {
  DirectoryTemplateLoader loader(std::filesystem::temp_directory_path() / "trellis_no_such_template_dir");
  EXPECT_THROW(loader.LoadTemplateHtml("skeleton.html"), MissingTemplateException);
}

}  // namespace
