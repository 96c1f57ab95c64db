#ifndef XML_NODE_HPP_INCLUDED
#define XML_NODE_HPP_INCLUDED

#include <map>
#include <string>
#include <vector>

#include "xml_node_fwd.hpp"

namespace xml
{

//an element of a parsed document: a name, attributes in the order they
//were first set, child elements and the element's own text.
class node
{
public:
	explicit node(const std::string& name);

	const std::string& name() const { return name_; }

	//empty string when the attribute is not set.
	const std::string& attr(const std::string& key) const;
	bool has_attr(const std::string& key) const;
	void set_attr(const std::string& key, const std::string& value);
	const std::vector<std::string>& attr_order() const { return attr_order_; }

	const std::string& text() const { return text_; }
	void set_text(const std::string& text) { text_ = text; }

	void add_child(node_ptr child);
	const std::vector<node_ptr>& children() const { return children_; }

	//first child with the given name, or null.
	const_node_ptr get_child(const std::string& name) const;
	std::vector<const_node_ptr> get_children(const std::string& name) const;

private:
	std::string name_;
	std::map<std::string, std::string> attr_;
	std::vector<std::string> attr_order_;
	std::string text_;
	std::vector<node_ptr> children_;
};

}

#endif
