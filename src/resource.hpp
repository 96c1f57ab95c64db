#ifndef RESOURCE_HPP_INCLUDED
#define RESOURCE_HPP_INCLUDED

#include <string>
#include <vector>

#include "color.hpp"

namespace resource {

enum CATEGORY { CATEGORY_NORMAL, CATEGORY_SPECIAL, CATEGORY_FOOD, CATEGORY_UNKNOWN };

//resources that have icons, in the order they are displayed.
int num_resources();
const char* resource_name(int n);

//position in the display order, or -1.
int resource_index(const std::string& name);

//icon identifier for a resource name, e.g. "Monster Coins" ->
//"monster-coin". Names without an entry are lowercased with spaces
//turned into dashes.
std::string resource_icon(const std::string& name);

//light gray for names that are not resources.
graphics::color resource_color(const std::string& name);

//the color lightened so it reads as text on dark backgrounds.
graphics::color resource_text_color(const std::string& name);

CATEGORY resource_category(const std::string& name);
std::vector<std::string> resources_in_category(CATEGORY category);

}

#endif
