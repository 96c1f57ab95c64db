#include <iostream>
#include <set>

#include "asserts.hpp"
#include "filesystem.hpp"
#include "foreach.hpp"
#include "icon_catalog.hpp"
#include "preferences.hpp"
#include "xml_node.hpp"
#include "xml_parser.hpp"
#include "xml_utils.hpp"

icon_catalog::icon_catalog()
{}

void icon_catalog::add(const_icon_ptr ic)
{
	ASSERT_LOG(ic, "NULL ICON ADDED TO CATALOG");
	ic->validate();
	ASSERT_LOG(icons_.count(ic->id()) == 0, "ICON REPEATED: " << ic->id());
	icons_[ic->id()] = ic;
}

const_icon_ptr icon_catalog::get(const std::string& id) const
{
	std::map<std::string, const_icon_ptr>::const_iterator itor = icons_.find(id);
	if(itor != icons_.end()) {
		return itor->second;
	} else {
		return const_icon_ptr();
	}
}

bool icon_catalog::has(const std::string& id) const
{
	return icons_.count(id) != 0;
}

std::vector<std::string> icon_catalog::all() const
{
	std::vector<std::string> res;
	for(std::map<std::string, const_icon_ptr>::const_iterator i = icons_.begin(); i != icons_.end(); ++i) {
		res.push_back(i->first);
	}

	return res;
}

std::vector<std::string> icon_catalog::load_document(xml::const_node_ptr root, const std::string& default_id)
{
	std::vector<const_icon_ptr> loaded;
	if(root->name() == "svg" && root->get_child("symbol")) {
		foreach(const xml::node_ptr& child, root->children()) {
			if(child->name() == "symbol") {
				loaded.push_back(const_icon_ptr(new icon(child)));
			} else {
				ASSERT_LOG(child->name() == "title" || child->name() == "desc" || child->name() == "metadata",
				           "UNSUPPORTED ELEMENT <" << child->name() << "> IN SPRITE SHEET");
			}
		}
	} else {
		loaded.push_back(const_icon_ptr(new icon(root, default_id)));
	}

	std::set<std::string> ids;
	foreach(const const_icon_ptr& ic, loaded) {
		ASSERT_LOG(!has(ic->id()) && ids.insert(ic->id()).second, "ICON REPEATED: " << ic->id());
	}

	std::vector<std::string> res;
	foreach(const const_icon_ptr& ic, loaded) {
		icons_[ic->id()] = ic;
		res.push_back(ic->id());
		if(preferences::verbose()) {
			std::cerr << "LOAD ICON: " << ic->id() << "\n";
		}
	}

	return res;
}

std::vector<std::string> icon_catalog::load_document(const std::string& doc, const std::string& default_id)
{
	return load_document(xml::parse_xml(doc), default_id);
}

std::vector<std::string> icon_catalog::load_file(const std::string& fname)
{
	try {
		return load_document(sys::read_file(fname), sys::file_stem(fname));
	} catch(validation_failure_exception& e) {
		e.msg = fname + ": " + e.msg;
		throw;
	}
}

std::vector<std::string> icon_catalog::load_directory(const std::string& dir)
{
	std::vector<std::string> res;
	foreach(const std::string& fname, sys::get_files_in_dir(dir, ".svg")) {
		const std::vector<std::string> ids = load_file(fname);
		res.insert(res.end(), ids.begin(), ids.end());
	}

	return res;
}

std::vector<std::string> icon_catalog::load_path(const std::string& path)
{
	if(sys::is_directory(path)) {
		return load_directory(path);
	}

	return load_file(path);
}

xml::node_ptr icon_catalog::write_sprite_sheet() const
{
	xml::node_ptr res(new xml::node("svg"));
	res->set_attr("xmlns", icon::SvgNamespace);
	for(std::map<std::string, const_icon_ptr>::const_iterator i = icons_.begin(); i != icons_.end(); ++i) {
		res->add_child(i->second->write_symbol());
	}

	return res;
}

bool operator==(const icon_catalog& a, const icon_catalog& b)
{
	if(a.size() != b.size()) {
		return false;
	}

	foreach(const std::string& id, a.all()) {
		const_icon_ptr other = b.get(id);
		if(!other || *other != *a.get(id)) {
			return false;
		}
	}

	return true;
}

bool operator!=(const icon_catalog& a, const icon_catalog& b)
{
	return !(a == b);
}
