#include <set>
#include <string>

#include <boost/shared_ptr.hpp>

#include "builtin_icons.hpp"
#include "foreach.hpp"
#include "icon_catalog.hpp"
#include "test_helpers.hpp"
#include "xml_node.hpp"
#include "xml_parser.hpp"
#include "xml_writer.hpp"

using graphics::color;
using graphics::paint;

TEST(BuiltinIconsTest, HasTheGameResources)
{
	const char* const Expected[] = {
		"stone", "iron", "copper", "thorium", "monster-coin", "force-core",
		"spirit-core", "magic-core", "void-core", "unstoppable-force",
		"serene-spirit", "multitudation-vortex",
	};

	const std::vector<std::string>& ids = builtin_icons::ids();
	ASSERT_EQ(12u, ids.size());
	for(int n = 0; n != ids.size(); ++n) {
		EXPECT_EQ(Expected[n], ids[n]);
		EXPECT_TRUE(builtin_icons::is_builtin(ids[n]));
	}

	EXPECT_FALSE(builtin_icons::is_builtin("gold"));
	EXPECT_FALSE(builtin_icons::create("gold"));
}

TEST(BuiltinIconsTest, IdsAreUnique)
{
	std::set<std::string> seen;
	foreach(const std::string& id, builtin_icons::ids()) {
		EXPECT_TRUE(seen.insert(id).second) << id;
	}

	EXPECT_EQ(builtin_icons::ids().size(), static_cast<size_t>(builtin_icons::catalog().size()));
}

TEST(BuiltinIconsTest, StoneIsGrayOnTheStandardCanvas)
{
	const_icon_ptr stone = builtin_icons::catalog().get("stone");
	ASSERT_TRUE(stone);
	EXPECT_EQ(paint(color(128, 128, 128)), stone->primary_fill());
	EXPECT_TRUE(view_box(0.0, 0.0, 100.0, 100.0) == stone->canvas());
	EXPECT_DOUBLE_EQ(100.0, stone->width());
	EXPECT_DOUBLE_EQ(100.0, stone->height());

	ASSERT_EQ(2u, stone->shapes().size());
	EXPECT_STREQ("polygon", stone->shapes()[1]->type());
	EXPECT_EQ(paint(color(158, 158, 158)), stone->shapes()[1]->fill());
}

TEST(BuiltinIconsTest, ForceCoreIsAWhiteTriangleOnARedDisc)
{
	const_icon_ptr core = builtin_icons::catalog().get("force-core");
	ASSERT_TRUE(core);
	ASSERT_EQ(2u, core->shapes().size());

	boost::shared_ptr<const circle_shape> disc = boost::dynamic_pointer_cast<const circle_shape>(core->shapes()[0]);
	ASSERT_TRUE(disc);
	EXPECT_EQ(paint(color(255, 0, 0)), disc->fill());
	EXPECT_EQ(paint(color(215, 0, 0)), disc->stroke());
	EXPECT_DOUBLE_EQ(2.0, disc->stroke_width());
	EXPECT_TRUE(point(50.0, 50.0) == disc->center());
	EXPECT_DOUBLE_EQ(48.0, disc->radius());

	boost::shared_ptr<const poly_shape> triangle = boost::dynamic_pointer_cast<const poly_shape>(core->shapes()[1]);
	ASSERT_TRUE(triangle);
	EXPECT_TRUE(triangle->closed());
	ASSERT_EQ(3u, triangle->points().size());
	EXPECT_EQ(paint(color(255, 255, 255)), triangle->fill());
	EXPECT_TRUE(point(26.0, 34.0) == triangle->points()[0]);
	EXPECT_TRUE(point(74.0, 50.0) == triangle->points()[1]);
	EXPECT_TRUE(point(26.0, 66.0) == triangle->points()[2]);
}

TEST(BuiltinIconsTest, EveryIconIsWellFormed)
{
	foreach(const std::string& id, builtin_icons::ids()) {
		const_icon_ptr ic = builtin_icons::catalog().get(id);
		ASSERT_TRUE(ic) << id;
		EXPECT_NO_THROW(ic->validate()) << id;
		EXPECT_TRUE(ic->content_inside_canvas()) << id << ": " << ic->content_bounds();

		//the background disc in the icon's own color comes first.
		EXPECT_STREQ("circle", ic->shapes().front()->type()) << id;
		EXPECT_EQ(paint(builtin_icons::icon_color(id)), ic->primary_fill()) << id;
		EXPECT_EQ(paint(builtin_icons::icon_color(id).darken(40)), ic->shapes().front()->stroke()) << id;

		foreach(const const_shape_ptr& s, ic->shapes()) {
			EXPECT_TRUE(s->paints_something()) << id << " " << s->type();
		}
	}
}

TEST(BuiltinIconsTest, EveryIconSurvivesWritingExactly)
{
	foreach(const std::string& id, builtin_icons::ids()) {
		const_icon_ptr ic = builtin_icons::create(id);
		const std::string svg = ic->to_svg();
		const icon reread(xml::parse_xml(svg));
		EXPECT_TRUE(*ic == reread) << svg;
		EXPECT_EQ(svg, reread.to_svg());
	}
}

TEST(BuiltinIconsTest, CatalogSurvivesSpriteSheet)
{
	icon_catalog reread;
	reread.load_document(xml::output_xml(builtin_icons::catalog().write_sprite_sheet()));
	EXPECT_TRUE(builtin_icons::catalog() == reread);
}

TEST(BuiltinIconsTest, CreateBuildsFreshEqualIcons)
{
	const_icon_ptr a = builtin_icons::create("copper");
	const_icon_ptr b = builtin_icons::create("copper");
	EXPECT_NE(a.get(), b.get());
	EXPECT_TRUE(*a == *b);
	EXPECT_TRUE(*a == *builtin_icons::catalog().get("copper"));
}

TEST(BuiltinIconsTest, ShapesOfSelectedIcons)
{
	const_icon_ptr iron = builtin_icons::catalog().get("iron");
	boost::shared_ptr<const rect_shape> bar = boost::dynamic_pointer_cast<const rect_shape>(iron->shapes()[1]);
	ASSERT_TRUE(bar);
	EXPECT_DOUBLE_EQ(22.0, bar->x());
	EXPECT_DOUBLE_EQ(31.0, bar->y());
	EXPECT_DOUBLE_EQ(57.6, bar->w());
	EXPECT_DOUBLE_EQ(38.4, bar->h());

	EXPECT_EQ(5u, builtin_icons::catalog().get("thorium")->shapes().size());
	EXPECT_EQ(8u, builtin_icons::catalog().get("multitudation-vortex")->shapes().size());
	EXPECT_STREQ("polyline", builtin_icons::catalog().get("spirit-core")->shapes()[1]->type());
	EXPECT_STREQ("line", builtin_icons::catalog().get("unstoppable-force")->shapes()[2]->type());

	boost::shared_ptr<const poly_shape> star = boost::dynamic_pointer_cast<const poly_shape>(
	    builtin_icons::catalog().get("magic-core")->shapes()[1]);
	ASSERT_TRUE(star);
	EXPECT_EQ(10u, star->points().size());
	EXPECT_EQ(paint(color(255, 215, 0)), star->fill());
}

TEST(BuiltinIconsTest, DefaultIconIsAQuestionMark)
{
	const_icon_ptr unknown = builtin_icons::default_icon("gold");
	EXPECT_EQ("gold", unknown->id());
	EXPECT_EQ(paint(color(255, 0, 255)), unknown->primary_fill());
	EXPECT_EQ(color(255, 0, 255), builtin_icons::icon_color("gold"));

	ASSERT_EQ(2u, unknown->shapes().size());
	boost::shared_ptr<const text_shape> mark = boost::dynamic_pointer_cast<const text_shape>(unknown->shapes()[1]);
	ASSERT_TRUE(mark);
	EXPECT_EQ("?", mark->text());
	EXPECT_EQ("middle", mark->anchor());
	EXPECT_TRUE(unknown->content_inside_canvas());

	EXPECT_THROW(builtin_icons::default_icon(""), validation_failure_exception);
}
