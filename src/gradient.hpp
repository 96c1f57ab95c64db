#ifndef GRADIENT_HPP_INCLUDED
#define GRADIENT_HPP_INCLUDED

#include <string>
#include <vector>

#include "color.hpp"
#include "geometry.hpp"
#include "xml_node_fwd.hpp"

namespace graphics
{

//a linearGradient or radialGradient definition. Its id is only
//meaningful inside the icon that defines it.
class gradient
{
public:
	enum TYPE { GRADIENT_LINEAR, GRADIENT_RADIAL };
	enum UNITS { UNITS_OBJECT_BOUNDING_BOX, UNITS_USER_SPACE };

	struct stop {
		stop() : offset(0.0) {}
		stop(double o, const color& c) : offset(o), col(c) {}
		double offset;
		color col;
	};

	explicit gradient(xml::const_node_ptr node);
	gradient(TYPE type, const std::string& id);

	const std::string& id() const { return id_; }
	TYPE type() const { return type_; }
	UNITS units() const { return units_; }
	void set_units(UNITS units) { units_ = units; }

	void set_line(double x1, double y1, double x2, double y2);
	void set_circle(double cx, double cy, double r);

	double x1() const { return x1_; }
	double y1() const { return y1_; }
	double x2() const { return x2_; }
	double y2() const { return y2_; }
	double cx() const { return cx_; }
	double cy() const { return cy_; }
	double r() const { return r_; }

	//offsets must be in 0..1 and may not decrease.
	void add_stop(double offset, const color& c);
	const std::vector<stop>& stops() const { return stops_; }

	//throws if the definition could not be used.
	void validate() const;

	gradient transformed(const scale_transform& t) const;

	xml::node_ptr write() const;

private:
	std::string id_;
	TYPE type_;
	UNITS units_;
	double x1_, y1_, x2_, y2_;
	double cx_, cy_, r_;
	std::vector<stop> stops_;
};

bool operator==(const gradient& a, const gradient& b);
bool operator!=(const gradient& a, const gradient& b);

}

#endif
