#ifndef GEOMETRY_HPP_INCLUDED
#define GEOMETRY_HPP_INCLUDED

#include <iosfwd>

struct point {
	point() : x(0.0), y(0.0) {}
	point(double xpos, double ypos) : x(xpos), y(ypos) {}
	double x, y;
};

bool operator==(const point& a, const point& b);
bool operator!=(const point& a, const point& b);
std::ostream& operator<<(std::ostream& s, const point& p);

//axis aligned box that grows to include the points added to it.
class bounds
{
public:
	bounds();
	bounds(double x1, double y1, double x2, double y2);

	void add(const point& p);
	void add(const bounds& b);

	bool empty() const { return empty_; }
	double x1() const { return x1_; }
	double y1() const { return y1_; }
	double x2() const { return x2_; }
	double y2() const { return y2_; }
	double w() const { return x2_ - x1_; }
	double h() const { return y2_ - y1_; }

	bool contains(const bounds& b, double tolerance=0.0) const;
private:
	bool empty_;
	double x1_, y1_, x2_, y2_;
};

std::ostream& operator<<(std::ostream& s, const bounds& b);

//scale about the origin followed by a translation; the only mapping
//icons need when they are fitted to a display size.
struct scale_transform {
	scale_transform() : sx(1.0), sy(1.0), tx(0.0), ty(0.0) {}
	scale_transform(double scale_x, double scale_y, double translate_x=0.0, double translate_y=0.0)
	  : sx(scale_x), sy(scale_y), tx(translate_x), ty(translate_y) {}

	point apply(const point& p) const { return point(p.x*sx + tx, p.y*sy + ty); }
	double apply_x(double x) const { return x*sx + tx; }
	double apply_y(double y) const { return y*sy + ty; }

	//factor for lengths with no direction, such as stroke widths.
	double length_scale() const;
	bool is_uniform() const;

	double sx, sy, tx, ty;
};

#endif
