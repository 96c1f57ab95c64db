#include "builtin_icons.hpp"
#include "resource.hpp"
#include "resource_formatter.hpp"
#include "test_helpers.hpp"

using graphics::color;

TEST(ResourceTest, EveryResourceHasABuiltinIcon)
{
	ASSERT_EQ(12, resource::num_resources());
	for(int n = 0; n != resource::num_resources(); ++n) {
		const std::string name = resource::resource_name(n);
		EXPECT_EQ(n, resource::resource_index(name));
		EXPECT_TRUE(builtin_icons::is_builtin(resource::resource_icon(name))) << name;
	}
}

TEST(ResourceTest, MapsNamesToIcons)
{
	EXPECT_EQ("stone", resource::resource_icon("Stone"));
	EXPECT_EQ("monster-coin", resource::resource_icon("Monster Coins"));
	EXPECT_EQ("multitudation-vortex", resource::resource_icon("Multitudation Vortex"));
	EXPECT_EQ("dragon-scale", resource::resource_icon("Dragon Scale"));
	EXPECT_EQ(-1, resource::resource_index("Dragon Scale"));
}

TEST(ResourceTest, Colors)
{
	EXPECT_EQ(color(128, 128, 128), resource::resource_color("Stone"));
	EXPECT_EQ(color(212, 175, 55), resource::resource_color("Monster Coins"));
	EXPECT_EQ(color(200, 200, 200), resource::resource_color("Grain"));
	EXPECT_EQ(color(168, 168, 168), resource::resource_text_color("Stone"));
	EXPECT_EQ(color(255, 40, 40), resource::resource_text_color("Force Core"));
}

TEST(ResourceTest, Categories)
{
	EXPECT_EQ(resource::CATEGORY_NORMAL, resource::resource_category("Iron"));
	EXPECT_EQ(resource::CATEGORY_SPECIAL, resource::resource_category("Void Core"));
	EXPECT_EQ(resource::CATEGORY_FOOD, resource::resource_category("Dairy"));
	EXPECT_EQ(resource::CATEGORY_UNKNOWN, resource::resource_category("Gold"));

	const std::vector<std::string> normal = resource::resources_in_category(resource::CATEGORY_NORMAL);
	ASSERT_EQ(4u, normal.size());
	EXPECT_EQ("Stone", normal[0]);
	EXPECT_EQ("Thorium", normal[3]);
	EXPECT_EQ(8u, resource::resources_in_category(resource::CATEGORY_SPECIAL).size());
	EXPECT_EQ(4u, resource::resources_in_category(resource::CATEGORY_FOOD).size());
	EXPECT_TRUE(resource::resources_in_category(resource::CATEGORY_UNKNOWN).empty());
}

TEST(ResourceFormatterTest, EmptyCostIsFree)
{
	EXPECT_EQ("Free", resource::format_cost(resource::amount_map()));
}

TEST(ResourceFormatterTest, FormatsInDisplayOrder)
{
	resource::amount_map cost;
	cost["Stone"] = 40;
	cost["Monster Coins"] = 2;
	cost["Zinc"] = 1;
	cost["Apples"] = 3;
	cost["Iron"] = 0;
	EXPECT_EQ("Monster Coins: 2, Stone: 40, Iron: 0, Apples: 3, Zinc: 1", resource::format_cost(cost));
	EXPECT_EQ("Monster Coins: 2\nStone: 40\nIron: 0\nApples: 3\nZinc: 1", resource::format_cost(cost, "\n"));
}

TEST(ResourceFormatterTest, ParsesCosts)
{
	const resource::amount_map cost = resource::parse_cost("Stone=40, Monster Coins = 2");
	ASSERT_EQ(2u, cost.size());
	EXPECT_EQ(40, cost.find("Stone")->second);
	EXPECT_EQ(2, cost.find("Monster Coins")->second);
	EXPECT_EQ("Monster Coins: 2, Stone: 40", resource::format_cost(cost));

	EXPECT_TRUE(resource::parse_cost("").empty());
	EXPECT_THROW(resource::parse_cost("Stone"), validation_failure_exception);
	EXPECT_THROW(resource::parse_cost("Stone=1.5"), validation_failure_exception);
	EXPECT_THROW(resource::parse_cost("Stone=-1"), validation_failure_exception);
	EXPECT_THROW(resource::parse_cost("Stone=1e20"), validation_failure_exception);
	EXPECT_EQ(2147483647, resource::parse_cost("Stone=2147483647")["Stone"]);
	EXPECT_THROW(resource::parse_cost("Stone=1,Stone=2"), validation_failure_exception);
}
