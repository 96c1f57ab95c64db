#ifndef ICON_CATALOG_HPP_INCLUDED
#define ICON_CATALOG_HPP_INCLUDED

#include <map>
#include <string>
#include <vector>

#include "icon.hpp"
#include "xml_node_fwd.hpp"

//a set of icons keyed by their unique identifier.
class icon_catalog
{
public:
	icon_catalog();

	//validates the icon; an identifier that is already present is an error.
	void add(const_icon_ptr ic);

	//null when there is no such icon.
	const_icon_ptr get(const std::string& id) const;
	bool has(const std::string& id) const;

	//identifiers in sorted order.
	std::vector<std::string> all() const;
	int size() const { return icons_.size(); }
	bool empty() const { return icons_.empty(); }

	//a sprite sheet (<svg> holding <symbol> elements) adds one icon per
	//symbol, any other <svg> adds a single icon named default_id unless it
	//has its own id. Either every icon of the document is added or, on
	//error, none. Returns the identifiers added.
	std::vector<std::string> load_document(xml::const_node_ptr root, const std::string& default_id="");
	std::vector<std::string> load_document(const std::string& doc, const std::string& default_id="");

	//a standalone icon takes the file name as its default identifier.
	std::vector<std::string> load_file(const std::string& fname);

	//every .svg file of the directory, in name order.
	std::vector<std::string> load_directory(const std::string& dir);

	//a file or a directory.
	std::vector<std::string> load_path(const std::string& path);

	xml::node_ptr write_sprite_sheet() const;

private:
	std::map<std::string, const_icon_ptr> icons_;
};

bool operator==(const icon_catalog& a, const icon_catalog& b);
bool operator!=(const icon_catalog& a, const icon_catalog& b);

#endif
