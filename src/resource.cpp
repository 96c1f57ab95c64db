#include <algorithm>

#include <boost/algorithm/string.hpp>

#include "builtin_icons.hpp"
#include "resource.hpp"

namespace resource {

namespace {
struct resource_info {
	const char* name;
	const char* icon;
	CATEGORY category;
};

const resource_info Resources[] = {
	{ "Monster Coins", "monster-coin", CATEGORY_SPECIAL },
	{ "Stone", "stone", CATEGORY_NORMAL },
	{ "Iron", "iron", CATEGORY_NORMAL },
	{ "Copper", "copper", CATEGORY_NORMAL },
	{ "Thorium", "thorium", CATEGORY_NORMAL },
	{ "Force Core", "force-core", CATEGORY_SPECIAL },
	{ "Spirit Core", "spirit-core", CATEGORY_SPECIAL },
	{ "Magic Core", "magic-core", CATEGORY_SPECIAL },
	{ "Void Core", "void-core", CATEGORY_SPECIAL },
	{ "Unstoppable Force", "unstoppable-force", CATEGORY_SPECIAL },
	{ "Serene Spirit", "serene-spirit", CATEGORY_SPECIAL },
	{ "Multitudation Vortex", "multitudation-vortex", CATEGORY_SPECIAL },
};

//food is produced by the village and has no icon of its own.
const char* const FoodResources[] = { "Grain", "Fruit", "Meat", "Dairy" };

const graphics::color UnknownColor(200, 200, 200);
}

int num_resources() { return sizeof(Resources)/sizeof(*Resources); }

const char* resource_name(int n)
{
	return Resources[n].name;
}

int resource_index(const std::string& name)
{
	for(int n = 0; n != num_resources(); ++n) {
		if(name == Resources[n].name) {
			return n;
		}
	}

	return -1;
}

std::string resource_icon(const std::string& name)
{
	const int index = resource_index(name);
	if(index != -1) {
		return Resources[index].icon;
	}

	std::string res = boost::algorithm::to_lower_copy(name);
	std::replace(res.begin(), res.end(), ' ', '-');
	return res;
}

graphics::color resource_color(const std::string& name)
{
	const int index = resource_index(name);
	if(index == -1) {
		return UnknownColor;
	}

	return builtin_icons::icon_color(Resources[index].icon);
}

graphics::color resource_text_color(const std::string& name)
{
	return resource_color(name).lighten(40);
}

CATEGORY resource_category(const std::string& name)
{
	const int index = resource_index(name);
	if(index != -1) {
		return Resources[index].category;
	}

	if(std::find(FoodResources, FoodResources + 4, name) != FoodResources + 4) {
		return CATEGORY_FOOD;
	}

	return CATEGORY_UNKNOWN;
}

std::vector<std::string> resources_in_category(CATEGORY category)
{
	std::vector<std::string> res;
	if(category == CATEGORY_FOOD) {
		res.assign(FoodResources, FoodResources + 4);
		return res;
	}

	for(int n = 0; n != num_resources(); ++n) {
		if(Resources[n].category == category) {
			res.push_back(Resources[n].name);
		}
	}

	return res;
}

}
