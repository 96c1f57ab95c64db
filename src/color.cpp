#include <cmath>
#include <cstdio>
#include <iostream>

#include <boost/algorithm/string.hpp>

#include "asserts.hpp"
#include "color.hpp"
#include "string_utils.hpp"

namespace graphics
{

namespace {
int clamp_channel(int value)
{
	if(value < 0) {
		return 0;
	} else if(value > 255) {
		return 255;
	}

	return value;
}

int hex_digit(char c, const std::string& str)
{
	if(c >= '0' && c <= '9') {
		return c - '0';
	} else if(c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	} else if(c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	}

	ASSERT_FAILED("ILLEGAL COLOR: '" << str << "'");
}

struct named_color {
	const char* name;
	int r, g, b;
};

const named_color NamedColors[] = {
	{ "black", 0, 0, 0 },
	{ "white", 255, 255, 255 },
	{ "red", 255, 0, 0 },
	{ "green", 0, 128, 0 },
	{ "lime", 0, 255, 0 },
	{ "blue", 0, 0, 255 },
	{ "yellow", 255, 255, 0 },
	{ "gray", 128, 128, 128 },
	{ "grey", 128, 128, 128 },
	{ "silver", 192, 192, 192 },
	{ "gold", 255, 215, 0 },
	{ "orange", 255, 165, 0 },
	{ "purple", 128, 0, 128 },
	{ "magenta", 255, 0, 255 },
	{ "cyan", 0, 255, 255 },
	{ "indigo", 75, 0, 130 },
	{ "turquoise", 64, 224, 208 },
	{ "darkred", 139, 0, 0 },
	{ "lightcyan", 224, 255, 255 },
	{ "lightsteelblue", 176, 196, 222 },
	{ "limegreen", 50, 205, 50 },
	{ "blueviolet", 138, 43, 226 },
	{ "orangered", 255, 69, 0 },
};
}

color color::from_string(const std::string& input)
{
	const std::string str = boost::algorithm::to_lower_copy(util::strip(input));

	if(!str.empty() && str[0] == '#') {
		if(str.size() == 4) {
			const int r = hex_digit(str[1], input);
			const int g = hex_digit(str[2], input);
			const int b = hex_digit(str[3], input);
			return color(r*17, g*17, b*17);
		}

		ASSERT_LOG(str.size() == 7, "ILLEGAL COLOR: '" << input << "'");
		int channels[3];
		for(int n = 0; n != 3; ++n) {
			channels[n] = hex_digit(str[1 + n*2], input)*16 + hex_digit(str[2 + n*2], input);
		}

		return color(channels[0], channels[1], channels[2]);
	}

	if(util::string_starts_with(str, "rgb(") && util::string_ends_with(str, ")")) {
		const std::vector<std::string> items = util::split(str.substr(4, str.size() - 5));
		ASSERT_LOG(items.size() == 3, "ILLEGAL COLOR: '" << input << "'");
		int channels[3];
		for(int n = 0; n != 3; ++n) {
			std::string item = items[n];
			double value = 0.0;
			if(util::string_ends_with(item, "%")) {
				item.resize(item.size() - 1);
				value = util::parse_number(item)*255.0/100.0;
			} else {
				value = util::parse_number(item);
			}

			ASSERT_LOG(value >= 0.0 && value <= 255.0, "COLOR CHANNEL OUT OF RANGE: '" << input << "'");
			channels[n] = static_cast<int>(value + 0.5);
		}

		return color(channels[0], channels[1], channels[2]);
	}

	for(int n = 0; n != sizeof(NamedColors)/sizeof(*NamedColors); ++n) {
		if(str == NamedColors[n].name) {
			return color(NamedColors[n].r, NamedColors[n].g, NamedColors[n].b);
		}
	}

	ASSERT_FAILED("ILLEGAL COLOR: '" << input << "'");
}

color::color() : r_(0), g_(0), b_(0), a_(255)
{}

color::color(int r, int g, int b, int a)
  : r_(clamp_channel(r)), g_(clamp_channel(g)), b_(clamp_channel(b)), a_(clamp_channel(a))
{}

color color::lighten(int amount) const
{
	return color(r_ + amount, g_ + amount, b_ + amount, a_);
}

color color::darken(int amount) const
{
	return color(r_ - amount, g_ - amount, b_ - amount, a_);
}

color color::with_alpha(int a) const
{
	return color(r_, g_, b_, a);
}

std::string color::to_string() const
{
	char buf[8];
	snprintf(buf, sizeof(buf), "#%02x%02x%02x", r_, g_, b_);
	return buf;
}

bool operator==(const color& a, const color& b)
{
	return a.r() == b.r() && a.g() == b.g() && a.b() == b.b() && a.a() == b.a();
}

bool operator!=(const color& a, const color& b)
{
	return !(a == b);
}

std::ostream& operator<<(std::ostream& s, const color& c)
{
	s << c.to_string();
	if(c.a() != 255) {
		s << "/" << c.a();
	}

	return s;
}

int opacity_to_alpha(double opacity)
{
	ASSERT_LOG(opacity >= 0.0 && opacity <= 1.0, "OPACITY OUT OF RANGE: " << opacity);
	return static_cast<int>(std::floor(opacity*255.0 + 0.5));
}

}
