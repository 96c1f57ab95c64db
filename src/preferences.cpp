#include "asserts.hpp"
#include "preferences.hpp"
#include "string_utils.hpp"
#include "xml_node.hpp"
#include "xml_parser.hpp"
#include "xml_utils.hpp"

namespace preferences {

namespace {
const int DefaultIconSize = 32;

int icon_width = DefaultIconSize;
int icon_height = DefaultIconSize;
bool builtin_icons = true;
std::vector<std::string> paths;
bool verbose_output = false;
}

int default_icon_width()
{
	return icon_width;
}

int default_icon_height()
{
	return icon_height;
}

void set_default_icon_size(int w, int h)
{
	ASSERT_LOG(w > 0 && h > 0, "ILLEGAL ICON SIZE: " << w << "x" << h);
	icon_width = w;
	icon_height = h;
}

bool use_builtin_icons()
{
	return builtin_icons;
}

void set_use_builtin_icons(bool value)
{
	builtin_icons = value;
}

const std::vector<std::string>& icon_paths()
{
	return paths;
}

void add_icon_path(const std::string& path)
{
	paths.push_back(path);
}

bool verbose()
{
	return verbose_output;
}

void set_verbose(bool value)
{
	verbose_output = value;
}

void parse_size(const std::string& str, int* w, int* h)
{
	const std::vector<std::string> v = util::split(str, 'x');
	ASSERT_LOG(v.size() == 2, "ILLEGAL SIZE '" << str << "', EXPECTED WxH");

	const double width = util::parse_number(v[0]);
	const double height = util::parse_number(v[1]);
	ASSERT_LOG(util::is_int_value(width) && util::is_int_value(height) && width > 0 && height > 0,
	           "ILLEGAL SIZE '" << str << "', EXPECTED WxH");
	*w = static_cast<int>(width);
	*h = static_cast<int>(height);
}

void load_preferences(xml::const_node_ptr node)
{
	ASSERT_LOG(node->name() == "preferences", "EXPECTED <preferences>, FOUND <" << node->name() << ">");

	if(node->has_attr("default_size")) {
		int w = 0, h = 0;
		parse_size(node->attr("default_size"), &w, &h);
		set_default_icon_size(w, h);
	}

	builtin_icons = xml::get_bool(node, "builtin", builtin_icons);
	verbose_output = xml::get_bool(node, "verbose", verbose_output);

	FOREACH_XML_CHILD(icons_node, node, "icons") {
		ASSERT_LOG(!icons_node->attr("path").empty(), "<icons> WITHOUT A path");
		add_icon_path(icons_node->attr("path"));
	}
}

void load_preferences(const std::string& fname)
{
	try {
		load_preferences(xml::parse_xml_from_file(fname));
	} catch(validation_failure_exception& e) {
		if(e.msg.compare(0, fname.size(), fname) != 0) {
			e.msg = fname + ": " + e.msg;
		}
		throw;
	}
}

bool parse_arg(const std::string& arg)
{
	static const std::string DefaultSizeArg = "--default-size=";
	if(arg == "--no-builtin") {
		builtin_icons = false;
	} else if(arg == "--verbose") {
		verbose_output = true;
	} else if(util::string_starts_with(arg, DefaultSizeArg)) {
		int w = 0, h = 0;
		parse_size(arg.substr(DefaultSizeArg.size()), &w, &h);
		set_default_icon_size(w, h);
	} else {
		return false;
	}

	return true;
}

void reset()
{
	icon_width = icon_height = DefaultIconSize;
	builtin_icons = true;
	paths.clear();
	verbose_output = false;
}

}
