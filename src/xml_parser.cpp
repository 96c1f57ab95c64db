/*
   Copyright (C) 2007 by David White <dave@whitevine.net>
   Part of the Silver Tree Project

   This program is free software; you can redistribute it and/or modify
   it under the terms of the GNU General Public License version 2 or later.
   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY.

   See the COPYING file for more details.
*/
#include <string>

#include <tinyxml.h>

#include "asserts.hpp"
#include "filesystem.hpp"
#include "xml_node.hpp"
#include "xml_parser.hpp"

namespace xml
{

namespace {
node_ptr convert_element(const TiXmlElement& el)
{
	node_ptr res(new node(el.Value()));

	for(const TiXmlAttribute* attr = el.FirstAttribute(); attr != NULL; attr = attr->Next()) {
		res->set_attr(attr->Name(), attr->Value());
	}

	const char* text = el.GetText();
	if(text != NULL) {
		res->set_text(text);
	}

	for(const TiXmlElement* child = el.FirstChildElement(); child != NULL; child = child->NextSiblingElement()) {
		res->add_child(convert_element(*child));
	}

	return res;
}
}

node_ptr parse_xml(const std::string& str)
{
	//text is kept as written so that it reads back unchanged.
	TiXmlBase::SetCondenseWhiteSpace(false);

	TiXmlDocument doc;
	doc.Parse(str.c_str(), 0, TIXML_ENCODING_UTF8);
	ASSERT_LOG(!doc.Error(), "XML PARSE ERROR AT " << doc.ErrorRow() << ":" << doc.ErrorCol() << ": " << doc.ErrorDesc());

	const TiXmlElement* el = doc.RootElement();
	ASSERT_LOG(el != NULL, "XML DOCUMENT HAS NO ROOT ELEMENT");
	return convert_element(*el);
}

node_ptr parse_xml_from_file(const std::string& fname)
{
	try {
		return parse_xml(sys::read_file(fname));
	} catch(validation_failure_exception& e) {
		e.msg = fname + ": " + e.msg;
		throw;
	}
}

}
