#include <gtest/gtest.h>

#include "html_document.hpp"

namespace {

const char* kPage = R"html(
<html><body>
  <div class="container">
    <h1>  Title
        here </h1>
    <table><tbody>
      <tr><td><a href="/a/1">first</a> <a href="/a/2">second</a></td><td>x</td></tr>
      <tr><td><span>no link</span></td><td><a href="/b">b</a></td></tr>
    </tbody></table>
    <div id="reader" data-path="/p" data-files="[&quot;1.jpg&quot;]" data-empty=""></div>
  </div>
</body></html>
)html";

} // namespace

TEST(HtmlDocument, SelectsRowsAndAttributes) {
    HtmlDocument doc(kPage);
    auto rows = doc.select("div.container table tbody tr");
    ASSERT_EQ(rows.size(), 2u);

    auto link = rows[0].select_first("td:nth-child(1) a:nth-child(1)");
    ASSERT_TRUE(link.has_value());
    EXPECT_EQ(link->attr("href").value_or(""), "/a/1");
    EXPECT_EQ(link->text(), "first");

    EXPECT_FALSE(rows[1].select_first("td:nth-child(1) a").has_value());
    EXPECT_EQ(rows[1].select("a").size(), 1u);
}

TEST(HtmlDocument, TextIsNormalized) {
    HtmlDocument doc(kPage);
    EXPECT_EQ(doc.select_text("h1").value_or(""), "Title here");
    EXPECT_FALSE(doc.select_text("h2").has_value());
}

TEST(HtmlDocument, AttributesDecodeEntitiesAndReportAbsence) {
    HtmlDocument doc(kPage);
    auto reader = doc.select_first("div#reader");
    ASSERT_TRUE(reader.has_value());
    EXPECT_EQ(reader->attr("data-files").value_or(""), "[\"1.jpg\"]");
    EXPECT_EQ(reader->attr("data-path").value_or(""), "/p");
    ASSERT_TRUE(reader->attr("data-empty").has_value());
    EXPECT_TRUE(reader->attr("data-empty")->empty());
    EXPECT_FALSE(reader->attr("data-missing").has_value());
}

TEST(HtmlDocument, Contains) {
    HtmlDocument doc(kPage);
    EXPECT_TRUE(doc.contains("div#reader"));
    EXPECT_FALSE(doc.contains("a.pagination-next"));
}

TEST(HtmlDocument, ElementsOutliveDocumentHandle) {
    std::optional<HtmlElement> link;
    {
        HtmlDocument doc(kPage);
        link = doc.select_first("td a");
    }
    ASSERT_TRUE(link.has_value());
    EXPECT_EQ(link->attr("href").value_or(""), "/a/1");
}

TEST(HtmlDocument, EmptyInput) {
    HtmlDocument doc("");
    EXPECT_TRUE(doc.select("tr").empty());
}
