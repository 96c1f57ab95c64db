#ifndef STRING_UTILS_HPP_INCLUDED
#define STRING_UTILS_HPP_INCLUDED

#include <string>
#include <vector>

namespace util {

//splits on the delimiter, trimming whitespace around each item and
//dropping empty items.
std::vector<std::string> split(const std::string& val, char c=',');

//splits on any run of whitespace and/or commas, the separator SVG uses
//for number lists.
std::vector<std::string> split_list(const std::string& val);

std::string strip(const std::string& s);

bool string_starts_with(const std::string& target, const std::string& prefix);
bool string_ends_with(const std::string& target, const std::string& suffix);

double parse_number(const std::string& s);

//shortest text that parses back to exactly d; no exponent for the
//magnitudes icons use and no trailing zeros.
std::string format_number(double d);

//true if d is a whole number that fits in an int.
bool is_int_value(double d);

}

#endif
