#ifndef BUILTIN_ICONS_HPP_INCLUDED
#define BUILTIN_ICONS_HPP_INCLUDED

#include <string>
#include <vector>

#include "color.hpp"
#include "icon.hpp"

class icon_catalog;

//the resource icons of the game, generated from their shape
//descriptions on a 100x100 canvas.
namespace builtin_icons {

const std::vector<std::string>& ids();
bool is_builtin(const std::string& id);

//color of the icon's background disc; magenta for anything else.
graphics::color icon_color(const std::string& id);

//null if id is not one of the built-in icons.
const_icon_ptr create(const std::string& id);

//stand-in for an icon that does not exist: a magenta disc with a
//question mark.
const_icon_ptr default_icon(const std::string& id);

void add_to(icon_catalog& catalog);

//catalog holding all the built-in icons, created on first use.
const icon_catalog& catalog();

}

#endif
