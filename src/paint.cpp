#include <iostream>

#include "asserts.hpp"
#include "paint.hpp"
#include "string_utils.hpp"

namespace graphics
{

paint paint::from_string(const std::string& input)
{
	const std::string str = util::strip(input);
	if(str == "none") {
		return paint();
	}

	if(util::string_starts_with(str, "url(")) {
		ASSERT_LOG(util::string_ends_with(str, ")"), "ILLEGAL PAINT: '" << input << "'");
		std::string ref = util::strip(str.substr(4, str.size() - 5));
		ASSERT_LOG(ref.size() > 1 && ref[0] == '#', "ONLY LOCAL PAINT REFERENCES ARE SUPPORTED: '" << input << "'");
		return reference(ref.substr(1));
	}

	return paint(color::from_string(str));
}

paint paint::reference(const std::string& id)
{
	ASSERT_LOG(!id.empty(), "EMPTY PAINT REFERENCE");
	paint res;
	res.type_ = PAINT_REFERENCE;
	res.ref_ = id;
	return res;
}

paint::paint() : type_(PAINT_NONE)
{}

paint::paint(const color& c) : type_(PAINT_COLOR), color_(c)
{}

const color& paint::get_color() const
{
	ASSERT_LOG(type_ == PAINT_COLOR, "PAINT IS NOT A COLOR: " << to_string());
	return color_;
}

const std::string& paint::reference_id() const
{
	ASSERT_LOG(type_ == PAINT_REFERENCE, "PAINT IS NOT A REFERENCE: " << to_string());
	return ref_;
}

paint paint::with_alpha(int alpha) const
{
	if(type_ != PAINT_COLOR) {
		return *this;
	}

	return paint(color_.with_alpha(alpha));
}

std::string paint::to_string() const
{
	switch(type_) {
	case PAINT_COLOR:
		return color_.to_string();
	case PAINT_REFERENCE:
		return "url(#" + ref_ + ")";
	default:
		return "none";
	}
}

bool operator==(const paint& a, const paint& b)
{
	if(a.type() != b.type()) {
		return false;
	}

	switch(a.type()) {
	case paint::PAINT_COLOR:
		return a.get_color() == b.get_color();
	case paint::PAINT_REFERENCE:
		return a.reference_id() == b.reference_id();
	default:
		return true;
	}
}

bool operator!=(const paint& a, const paint& b)
{
	return !(a == b);
}

std::ostream& operator<<(std::ostream& s, const paint& p)
{
	s << p.to_string();
	return s;
}

}
