#include "foreach.hpp"
#include "xml_node.hpp"

namespace xml
{

node::node(const std::string& name) : name_(name)
{}

const std::string& node::attr(const std::string& key) const
{
	std::map<std::string, std::string>::const_iterator i = attr_.find(key);
	if(i == attr_.end()) {
		static const std::string EmptyStr;
		return EmptyStr;
	}

	return i->second;
}

bool node::has_attr(const std::string& key) const
{
	return attr_.count(key) != 0;
}

void node::set_attr(const std::string& key, const std::string& value)
{
	if(attr_.count(key) == 0) {
		attr_order_.push_back(key);
	}

	attr_[key] = value;
}

void node::add_child(node_ptr child)
{
	children_.push_back(child);
}

const_node_ptr node::get_child(const std::string& name) const
{
	foreach(const node_ptr& child, children_) {
		if(child->name() == name) {
			return child;
		}
	}

	return const_node_ptr();
}

std::vector<const_node_ptr> node::get_children(const std::string& name) const
{
	std::vector<const_node_ptr> res;
	foreach(const node_ptr& child, children_) {
		if(child->name() == name) {
			res.push_back(child);
		}
	}

	return res;
}

}
