#include "foreach.hpp"
#include "xml_node.hpp"
#include "xml_writer.hpp"

namespace xml
{

std::string escape_xml(const std::string& str)
{
	std::string res;
	res.reserve(str.size());
	foreach(char c, str) {
		switch(c) {
		case '&': res += "&amp;"; break;
		case '<': res += "&lt;"; break;
		case '>': res += "&gt;"; break;
		case '"': res += "&quot;"; break;
		default: res.push_back(c); break;
		}
	}

	return res;
}

void write_xml(const const_node_ptr& node, std::string& res)
{
	std::string indent;
	write_xml(node, res, indent);
}

void write_xml(const const_node_ptr& node, std::string& res, std::string& indent)
{
	res += indent + "<" + node->name();

	foreach(const std::string& attr, node->attr_order()) {
		res += " " + attr + "=\"" + escape_xml(node->attr(attr)) + "\"";
	}

	if(node->children().empty() && node->text().empty()) {
		res += "/>\n";
		return;
	}

	res += ">";

	if(node->children().empty()) {
		res += escape_xml(node->text()) + "</" + node->name() + ">\n";
		return;
	}

	res += "\n";

	indent.push_back('\t');
	foreach(const node_ptr& child, node->children()) {
		write_xml(child, res, indent);
	}
	indent.resize(indent.size()-1);

	res += indent + "</" + node->name() + ">\n";
}

std::string output_xml(const const_node_ptr& node)
{
	std::string res = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
	write_xml(node, res);
	return res;
}

}
