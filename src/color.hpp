#ifndef COLOR_HPP_INCLUDED
#define COLOR_HPP_INCLUDED

#include <iosfwd>
#include <string>

namespace graphics
{

class color
{
public:
	//accepts #rgb, #rrggbb, rgb(r,g,b) and a few CSS color names.
	static color from_string(const std::string& str);

	color();
	color(int r, int g, int b, int a=255);

	int r() const { return r_; }
	int g() const { return g_; }
	int b() const { return b_; }
	int a() const { return a_; }

	//adds/subtracts the amount from each of r, g and b, clamped to 0..255.
	color lighten(int amount) const;
	color darken(int amount) const;

	color with_alpha(int a) const;

	double opacity() const { return a_/255.0; }

	//#rrggbb; alpha is not part of the text.
	std::string to_string() const;

private:
	unsigned char r_, g_, b_, a_;
};

bool operator==(const color& a, const color& b);
bool operator!=(const color& a, const color& b);
std::ostream& operator<<(std::ostream& s, const color& c);

//alpha for an SVG opacity value in 0..1.
int opacity_to_alpha(double opacity);

}

#endif
