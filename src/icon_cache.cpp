#include <iostream>

#include "asserts.hpp"
#include "builtin_icons.hpp"
#include "formatter.hpp"
#include "icon_cache.hpp"
#include "icon_catalog.hpp"
#include "preferences.hpp"

icon_cache::icon_cache(const icon_catalog& catalog) : catalog_(catalog)
{}

const_icon_ptr icon_cache::get(const std::string& id, int width, int height)
{
	ASSERT_LOG(width > 0 && height > 0, "ILLEGAL ICON SIZE: " << width << "x" << height);

	const std::string key = formatter() << id << "_" << width << "x" << height;
	std::map<std::string, const_icon_ptr>::const_iterator itor = cache_.find(key);
	if(itor != cache_.end()) {
		return itor->second;
	}

	const_icon_ptr source = catalog_.get(id);
	if(!source) {
		std::cerr << "UNKNOWN ICON: " << id << "\n";
		source = builtin_icons::default_icon(id);
	}

	const_icon_ptr res = source->scaled(width, height);
	cache_[key] = res;
	return res;
}

const_icon_ptr icon_cache::get(const std::string& id)
{
	return get(id, preferences::default_icon_width(), preferences::default_icon_height());
}

void icon_cache::clear()
{
	cache_.clear();
}
