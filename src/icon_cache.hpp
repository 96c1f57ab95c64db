#ifndef ICON_CACHE_HPP_INCLUDED
#define ICON_CACHE_HPP_INCLUDED

#include <map>
#include <string>

#include "icon.hpp"

class icon_catalog;

//icons of a catalog fitted to the sizes they are displayed at. Each
//id and size is built once. An id the catalog does not have gets the
//question mark icon instead.
class icon_cache
{
public:
	explicit icon_cache(const icon_catalog& catalog);

	const_icon_ptr get(const std::string& id, int width, int height);

	//at preferences::default_icon_width() x default_icon_height().
	const_icon_ptr get(const std::string& id);

	int size() const { return cache_.size(); }
	void clear();

private:
	const icon_catalog& catalog_;
	std::map<std::string, const_icon_ptr> cache_;
};

#endif
