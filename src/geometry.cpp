#include <algorithm>
#include <cmath>
#include <iostream>

#include "geometry.hpp"

bool operator==(const point& a, const point& b)
{
	return a.x == b.x && a.y == b.y;
}

bool operator!=(const point& a, const point& b)
{
	return !(a == b);
}

std::ostream& operator<<(std::ostream& s, const point& p)
{
	s << p.x << "," << p.y;
	return s;
}

bounds::bounds() : empty_(true), x1_(0.0), y1_(0.0), x2_(0.0), y2_(0.0)
{}

bounds::bounds(double x1, double y1, double x2, double y2)
  : empty_(false),
    x1_(std::min(x1, x2)), y1_(std::min(y1, y2)),
    x2_(std::max(x1, x2)), y2_(std::max(y1, y2))
{}

void bounds::add(const point& p)
{
	if(empty_) {
		x1_ = x2_ = p.x;
		y1_ = y2_ = p.y;
		empty_ = false;
		return;
	}

	x1_ = std::min(x1_, p.x);
	y1_ = std::min(y1_, p.y);
	x2_ = std::max(x2_, p.x);
	y2_ = std::max(y2_, p.y);
}

void bounds::add(const bounds& b)
{
	if(b.empty()) {
		return;
	}

	add(point(b.x1(), b.y1()));
	add(point(b.x2(), b.y2()));
}

bool bounds::contains(const bounds& b, double tolerance) const
{
	if(b.empty()) {
		return true;
	}

	if(empty_) {
		return false;
	}

	return b.x1() >= x1_ - tolerance && b.y1() >= y1_ - tolerance &&
	       b.x2() <= x2_ + tolerance && b.y2() <= y2_ + tolerance;
}

std::ostream& operator<<(std::ostream& s, const bounds& b)
{
	if(b.empty()) {
		s << "(empty)";
	} else {
		s << "(" << b.x1() << "," << b.y1() << ")-(" << b.x2() << "," << b.y2() << ")";
	}

	return s;
}

double scale_transform::length_scale() const
{
	return std::sqrt(std::fabs(sx*sy));
}

bool scale_transform::is_uniform() const
{
	return std::fabs(sx - sy) <= 1e-9*std::max(std::fabs(sx), std::fabs(sy));
}
