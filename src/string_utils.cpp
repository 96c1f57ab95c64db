#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "asserts.hpp"
#include "foreach.hpp"
#include "string_utils.hpp"

namespace util {

std::vector<std::string> split(const std::string& val, char c)
{
	std::vector<std::string> res;
	std::vector<std::string> items;
	boost::algorithm::split(items, val, boost::algorithm::is_from_range(c, c));
	foreach(std::string& item, items) {
		boost::algorithm::trim(item);
		if(!item.empty()) {
			res.push_back(item);
		}
	}

	return res;
}

std::vector<std::string> split_list(const std::string& val)
{
	std::vector<std::string> res;
	std::vector<std::string> items;
	boost::algorithm::split(items, val, boost::algorithm::is_any_of(", \t\r\n"), boost::algorithm::token_compress_on);
	foreach(const std::string& item, items) {
		if(!item.empty()) {
			res.push_back(item);
		}
	}

	return res;
}

std::string strip(const std::string& s)
{
	return boost::algorithm::trim_copy(s);
}

bool string_starts_with(const std::string& target, const std::string& prefix)
{
	return boost::algorithm::starts_with(target, prefix);
}

bool string_ends_with(const std::string& target, const std::string& suffix)
{
	return boost::algorithm::ends_with(target, suffix);
}

double parse_number(const std::string& s)
{
	double res = 0.0;
	const bool ok = boost::conversion::try_lexical_convert(strip(s), res);
	ASSERT_LOG(ok && !std::isnan(res) && !std::isinf(res), "ILLEGAL NUMBER: '" << s << "'");
	return res;
}

std::string format_number(double d)
{
	if(d == 0.0) {
		//avoids writing -0
		return "0";
	}

	//the fewest digits that read back as the same double.
	char buf[64];
	for(int precision = 15; precision <= 17; ++precision) {
		snprintf(buf, sizeof(buf), "%.*g", precision, d);
		if(std::strtod(buf, NULL) == d) {
			break;
		}
	}

	return buf;
}

bool is_int_value(double d)
{
	return d >= std::numeric_limits<int>::min() && d <= std::numeric_limits<int>::max() && std::floor(d) == d;
}

}
