#ifndef PAINT_HPP_INCLUDED
#define PAINT_HPP_INCLUDED

#include <iosfwd>
#include <string>

#include "color.hpp"

namespace graphics
{

//the value of a fill or stroke: nothing, a solid color, or a reference
//to a gradient defined by the same icon.
class paint
{
public:
	enum TYPE { PAINT_NONE, PAINT_COLOR, PAINT_REFERENCE };

	//"none", any color accepted by color::from_string, or url(#id).
	static paint from_string(const std::string& str);
	static paint reference(const std::string& id);

	paint();
	explicit paint(const color& c);

	TYPE type() const { return type_; }
	bool is_none() const { return type_ == PAINT_NONE; }
	bool is_color() const { return type_ == PAINT_COLOR; }
	bool is_reference() const { return type_ == PAINT_REFERENCE; }

	const color& get_color() const;
	const std::string& reference_id() const;

	//a color paint with its alpha replaced; other paints unchanged.
	paint with_alpha(int alpha) const;

	std::string to_string() const;

private:
	TYPE type_;
	color color_;
	std::string ref_;
};

bool operator==(const paint& a, const paint& b);
bool operator!=(const paint& a, const paint& b);
std::ostream& operator<<(std::ostream& s, const paint& p);

}

#endif
