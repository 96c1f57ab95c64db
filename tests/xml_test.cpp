#include "test_helpers.hpp"
#include "xml_node.hpp"
#include "xml_parser.hpp"
#include "xml_utils.hpp"
#include "xml_writer.hpp"

TEST(XmlTest, ParsesElementsAttributesAndText)
{
	xml::node_ptr root = xml::parse_xml(
	    "<?xml version=\"1.0\"?>\n"
	    "<!-- comment -->\n"
	    "<svg viewBox=\"0 0 10 10\" id=\"a\">\n"
	    "  <title>A &amp; B</title>\n"
	    "  <circle cx=\"5\" cy=\"5\" r=\"4\"/>\n"
	    "  <circle cx=\"1\" cy=\"1\" r=\"1\"/>\n"
	    "</svg>\n");

	EXPECT_EQ("svg", root->name());
	EXPECT_EQ("a", root->attr("id"));
	EXPECT_EQ("", root->attr("width"));
	EXPECT_FALSE(root->has_attr("width"));
	ASSERT_EQ(3u, root->children().size());
	EXPECT_EQ("A & B", root->get_child("title")->text());
	EXPECT_EQ(2u, root->get_children("circle").size());
	EXPECT_FALSE(root->get_child("rect"));

	ASSERT_EQ(2u, root->attr_order().size());
	EXPECT_EQ("viewBox", root->attr_order()[0]);
	EXPECT_EQ("id", root->attr_order()[1]);
}

TEST(XmlTest, KeepsWhitespaceInText)
{
	xml::node_ptr root = xml::parse_xml("<svg>\n\t<text> two  spaces\tand a tab </text>\n</svg>\n");
	ASSERT_EQ(1u, root->children().size());
	EXPECT_EQ(" two  spaces\tand a tab ", root->children()[0]->text());
	EXPECT_EQ("", root->text());

	xml::node_ptr reread = xml::parse_xml(xml::output_xml(root));
	EXPECT_EQ(" two  spaces\tand a tab ", reread->children()[0]->text());
}

TEST(XmlTest, ReportsParseErrors)
{
	EXPECT_THROW(xml::parse_xml("<svg><circle></svg>"), validation_failure_exception);
	EXPECT_THROW(xml::parse_xml(""), validation_failure_exception);
}

TEST(XmlTest, WritesIndentedDocument)
{
	xml::node_ptr root(new xml::node("svg"));
	root->set_attr("id", "q");
	xml::node_ptr text(new xml::node("text"));
	text->set_attr("x", "1");
	text->set_text("a<b");
	root->add_child(text);
	root->add_child(xml::node_ptr(new xml::node("g")));

	EXPECT_EQ("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
	          "<svg id=\"q\">\n"
	          "\t<text x=\"1\">a&lt;b</text>\n"
	          "\t<g/>\n"
	          "</svg>\n", xml::output_xml(root));
}

TEST(XmlTest, EscapesSpecialCharacters)
{
	EXPECT_EQ("&lt;&quot;a&quot; &amp; b&gt;", xml::escape_xml("<\"a\" & b>"));

	xml::node_ptr root(new xml::node("n"));
	root->set_attr("v", "\"x\" & <y>");
	xml::node_ptr reread = xml::parse_xml(xml::output_xml(root));
	EXPECT_EQ("\"x\" & <y>", reread->attr("v"));
}

TEST(XmlTest, SettingAnAttributeTwiceKeepsItsPosition)
{
	xml::node n("n");
	n.set_attr("a", "1");
	n.set_attr("b", "2");
	n.set_attr("a", "3");
	ASSERT_EQ(2u, n.attr_order().size());
	EXPECT_EQ("a", n.attr_order()[0]);
	EXPECT_EQ("3", n.attr("a"));
}

TEST(XmlTest, ReadsTypedAttributes)
{
	xml::const_node_ptr n = xml::parse_xml("<n i=\"12\" d=\"2.5\" b=\"yes\" f=\"no\" len=\"32px\" bad=\"1.5\" huge=\"1e20\" word=\"maybe\"/>");
	EXPECT_EQ(12, xml::get_int(n, "i"));
	EXPECT_EQ(7, xml::get_int(n, "missing", 7));
	EXPECT_THROW(xml::get_int(n, "bad"), validation_failure_exception);
	EXPECT_THROW(xml::get_int(n, "huge"), validation_failure_exception);
	EXPECT_DOUBLE_EQ(2.5, xml::get_double(n, "d"));
	EXPECT_TRUE(xml::get_bool(n, "b"));
	EXPECT_FALSE(xml::get_bool(n, "f", true));
	EXPECT_TRUE(xml::get_bool(n, "missing", true));
	EXPECT_THROW(xml::get_bool(n, "word"), validation_failure_exception);
	EXPECT_DOUBLE_EQ(32.0, xml::get_length(n, "len"));
	EXPECT_THROW(xml::get_length(n, "word"), validation_failure_exception);
}
