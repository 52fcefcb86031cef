#include <gtest/gtest.h>

#include <drawio_loaders/label_text.hpp>

using drawio_loaders::decode_entities;
using drawio_loaders::extract_label_text;
using drawio_loaders::trim;

TEST(LabelTextTests, PlainTextIsKept)
{
    EXPECT_EQ(extract_label_text("Jane Doe"), "Jane Doe");
    EXPECT_EQ(extract_label_text("  rico:Person "), "rico:Person");
    EXPECT_EQ(extract_label_text(""), "");
}

TEST(LabelTextTests, BlocksAreConcatenated)
{
    EXPECT_EQ(extract_label_text("<div>Jane</div><div>Doe</div>"), "JaneDoe");
    EXPECT_EQ(extract_label_text("<p>rico:Person</p>"), "rico:Person");
    EXPECT_EQ(extract_label_text("Jane<br>Doe"), "JaneDoe");
}

TEST(LabelTextTests, SingleEmptyLineIsDropped)
{
    EXPECT_EQ(extract_label_text("<div>first</div><div><br></div><div>second</div>"), "firstsecond");
}

TEST(LabelTextTests, TwoEmptyLinesGiveOneParagraphBreak)
{
    EXPECT_EQ(extract_label_text("<div>first</div><div><br></div><div><br></div><div>second</div>"),
        "first\nsecond");
    EXPECT_EQ(extract_label_text("first<br><br><br>second"), "first\nsecond");
}

TEST(LabelTextTests, LongerRunsStillGiveOneBreak)
{
    EXPECT_EQ(extract_label_text("a<div></div><div></div><div></div><div></div>b"), "a\nb");
}

TEST(LabelTextTests, LeadingAndTrailingEmptyLinesAreDropped)
{
    EXPECT_EQ(extract_label_text("<br><br><div>Oslo</div><br><br>"), "Oslo");
}

TEST(LabelTextTests, InlineTagsAreIgnored)
{
    EXPECT_EQ(extract_label_text("<span style=\"color: red\">Jane <b>Doe</b></span>"), "Jane Doe");
    EXPECT_EQ(extract_label_text("Jane<!-- comment --> Doe"), "Jane Doe");
}

TEST(LabelTextTests, EntitiesAreDecoded)
{
    EXPECT_EQ(extract_label_text("Smith &amp; Sons"), "Smith & Sons");
    EXPECT_EQ(extract_label_text("Jane&nbsp;Doe"), "Jane Doe");
    EXPECT_EQ(decode_entities("&lt;&gt;&quot;&apos;&#39;&#x41;"), "<>\"''A");
    EXPECT_EQ(decode_entities("&#233;"), "\xC3\xA9");
}

TEST(LabelTextTests, UnknownEntitiesAreLeftAlone)
{
    EXPECT_EQ(decode_entities("a & b"), "a & b");
    EXPECT_EQ(decode_entities("&bogus;"), "&bogus;");
}

TEST(LabelTextTests, ExtractionIsReentrant)
{
    const std::string first = extract_label_text("<div>a</div><br><br><div>b</div>");
    EXPECT_EQ(extract_label_text("<div>c</div>"), "c");
    EXPECT_EQ(extract_label_text("<div>a</div><br><br><div>b</div>"), first);
}

TEST(LabelTextTests, Trim)
{
    EXPECT_EQ(trim(" \t x y \n"), "x y");
    EXPECT_EQ(trim("   "), "");
}
