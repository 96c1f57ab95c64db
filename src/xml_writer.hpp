#ifndef XML_WRITER_HPP_INCLUDED
#define XML_WRITER_HPP_INCLUDED

#include <string>

#include "xml_node_fwd.hpp"

namespace xml
{

void write_xml(const const_node_ptr& node, std::string& res);
void write_xml(const const_node_ptr& node, std::string& res, std::string& indent);

//the whole document: XML declaration, then the element tree indented
//with tabs, one element per line.
std::string output_xml(const const_node_ptr& node);

std::string escape_xml(const std::string& str);

}

#endif
