#ifndef XML_UTILS_HPP_INCLUDED
#define XML_UTILS_HPP_INCLUDED

#include <string>

#include "foreach.hpp"
#include "xml_node.hpp"

namespace xml
{

int get_int(const_node_ptr node, const std::string& key, int def_value=0);
double get_double(const_node_ptr node, const std::string& key, double def_value=0.0);
bool get_bool(const_node_ptr node, const std::string& key, bool def_value=false);

//reads a length such as "32" or "32px". Other units are rejected.
double get_length(const_node_ptr node, const std::string& key, double def_value=0.0);

}

#define FOREACH_XML_CHILD(child_name, parent, child_key) \
	foreach(const xml::const_node_ptr& child_name, (parent)->get_children(child_key))

#endif
