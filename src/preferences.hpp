#ifndef PREFERENCES_HPP_INCLUDED
#define PREFERENCES_HPP_INCLUDED

#include <string>
#include <vector>

#include "xml_node_fwd.hpp"

namespace preferences {

//size icons are fitted to when no size is asked for. Default 32x32.
int default_icon_width();
int default_icon_height();
void set_default_icon_size(int w, int h);

//whether the game's own icons are part of the catalog. Default on.
bool use_builtin_icons();
void set_use_builtin_icons(bool value);

//files and directories icons are loaded from, in addition to the
//built-in ones.
const std::vector<std::string>& icon_paths();
void add_icon_path(const std::string& path);

//prints a line for every icon loaded. Default off.
bool verbose();
void set_verbose(bool value);

//reads "WxH", e.g. "32x32".
void parse_size(const std::string& str, int* w, int* h);

//<preferences default_size="32x32" builtin="yes" verbose="no">
//  <icons path="data/icons"/>
//</preferences>
void load_preferences(xml::const_node_ptr node);
void load_preferences(const std::string& fname);

//handles a command line switch that sets a preference: --no-builtin,
//--verbose or --default-size=WxH. False if arg is none of them.
bool parse_arg(const std::string& arg);

//restores every preference to its default.
void reset();

}

#endif
