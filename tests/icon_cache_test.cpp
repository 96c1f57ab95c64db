#include "builtin_icons.hpp"
#include "icon_cache.hpp"
#include "icon_catalog.hpp"
#include "preferences.hpp"
#include "test_helpers.hpp"

using graphics::color;
using graphics::paint;

TEST(IconCacheTest, BuildsEachSizeOnce)
{
	icon_cache cache(builtin_icons::catalog());
	const_icon_ptr a = cache.get("stone", 24, 24);
	const_icon_ptr b = cache.get("stone", 24, 24);
	EXPECT_EQ(a.get(), b.get());
	EXPECT_EQ(1, cache.size());

	const_icon_ptr c = cache.get("stone", 48, 48);
	EXPECT_NE(a.get(), c.get());
	EXPECT_EQ(2, cache.size());

	cache.clear();
	EXPECT_EQ(0, cache.size());
	EXPECT_NE(a.get(), cache.get("stone", 24, 24).get());
}

TEST(IconCacheTest, FitsIconsToTheRequestedSize)
{
	icon_cache cache(builtin_icons::catalog());
	const_icon_ptr ic = cache.get("force-core", 50, 25);
	EXPECT_TRUE(view_box(0.0, 0.0, 50.0, 25.0) == ic->canvas());
	EXPECT_DOUBLE_EQ(50.0, ic->width());
	EXPECT_DOUBLE_EQ(25.0, ic->height());
	EXPECT_STREQ("ellipse", ic->shapes()[0]->type());
	EXPECT_TRUE(ic->content_inside_canvas());
	EXPECT_NO_THROW(ic->validate());
	EXPECT_EQ(paint(color(255, 0, 0)), ic->primary_fill());
}

TEST(IconCacheTest, UsesDefaultSizeFromPreferences)
{
	preferences::reset();
	icon_cache cache(builtin_icons::catalog());
	EXPECT_DOUBLE_EQ(32.0, cache.get("iron")->width());

	preferences::set_default_icon_size(64, 48);
	const_icon_ptr ic = cache.get("iron");
	EXPECT_DOUBLE_EQ(64.0, ic->width());
	EXPECT_DOUBLE_EQ(48.0, ic->height());
	preferences::reset();
}

TEST(IconCacheTest, UnknownIdGetsQuestionMark)
{
	icon_catalog empty;
	icon_cache cache(empty);
	const_icon_ptr ic = cache.get("gold", 16, 16);
	ASSERT_TRUE(ic);
	EXPECT_EQ("gold", ic->id());
	EXPECT_EQ(paint(color(255, 0, 255)), ic->primary_fill());
	EXPECT_STREQ("text", ic->shapes().back()->type());
	EXPECT_EQ(ic.get(), cache.get("gold", 16, 16).get());
}

TEST(IconCacheTest, RejectsEmptySizes)
{
	icon_cache cache(builtin_icons::catalog());
	EXPECT_THROW(cache.get("stone", 0, 32), validation_failure_exception);
	EXPECT_THROW(cache.get("stone", 32, -1), validation_failure_exception);
}
