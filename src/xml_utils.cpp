#include "asserts.hpp"
#include "string_utils.hpp"
#include "xml_utils.hpp"

namespace xml
{

int get_int(const_node_ptr node, const std::string& key, int def_value)
{
	const std::string& str = node->attr(key);
	if(str.empty()) {
		return def_value;
	}

	const double value = util::parse_number(str);
	ASSERT_LOG(util::is_int_value(value), "EXPECTED INTEGER IN " << node->name() << "." << key << ": '" << str << "'");
	return static_cast<int>(value);
}

double get_double(const_node_ptr node, const std::string& key, double def_value)
{
	const std::string& str = node->attr(key);
	if(str.empty()) {
		return def_value;
	}

	return util::parse_number(str);
}

bool get_bool(const_node_ptr node, const std::string& key, bool def_value)
{
	const std::string& str = node->attr(key);
	if(str.empty()) {
		return def_value;
	}

	if(str == "yes" || str == "true" || str == "1") {
		return true;
	} else if(str == "no" || str == "false" || str == "0") {
		return false;
	}

	ASSERT_FAILED("EXPECTED BOOLEAN IN " << node->name() << "." << key << ": '" << str << "'");
}

double get_length(const_node_ptr node, const std::string& key, double def_value)
{
	std::string str = util::strip(node->attr(key));
	if(str.empty()) {
		return def_value;
	}

	if(util::string_ends_with(str, "px")) {
		str.resize(str.size() - 2);
	}

	return util::parse_number(str);
}

}
