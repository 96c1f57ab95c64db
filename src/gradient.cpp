#include "asserts.hpp"
#include "foreach.hpp"
#include "gradient.hpp"
#include "string_utils.hpp"
#include "xml_node.hpp"
#include "xml_utils.hpp"

namespace graphics
{

namespace {
//"50%" or "0.5"
double parse_fraction(const std::string& input, double def_value)
{
	std::string str = util::strip(input);
	if(str.empty()) {
		return def_value;
	}

	if(util::string_ends_with(str, "%")) {
		str.resize(str.size() - 1);
		return util::parse_number(str)/100.0;
	}

	return util::parse_number(str);
}

//reads stop-color and stop-opacity from the attributes or a style
//attribute, which takes precedence.
void read_stop_style(xml::const_node_ptr node, std::string& stop_color, std::string& stop_opacity)
{
	stop_color = node->attr("stop-color");
	stop_opacity = node->attr("stop-opacity");

	foreach(const std::string& decl, util::split(node->attr("style"), ';')) {
		const std::vector<std::string> kv = util::split(decl, ':');
		ASSERT_LOG(kv.size() == 2, "ILLEGAL STYLE DECLARATION: '" << decl << "'");
		if(kv[0] == "stop-color") {
			stop_color = kv[1];
		} else if(kv[0] == "stop-opacity") {
			stop_opacity = kv[1];
		}
	}
}
}

gradient::gradient(xml::const_node_ptr node)
  : id_(node->attr("id")),
    type_(node->name() == "radialGradient" ? GRADIENT_RADIAL : GRADIENT_LINEAR),
    units_(UNITS_OBJECT_BOUNDING_BOX),
    x1_(parse_fraction(node->attr("x1"), 0.0)),
    y1_(parse_fraction(node->attr("y1"), 0.0)),
    x2_(parse_fraction(node->attr("x2"), 1.0)),
    y2_(parse_fraction(node->attr("y2"), 0.0)),
    cx_(parse_fraction(node->attr("cx"), 0.5)),
    cy_(parse_fraction(node->attr("cy"), 0.5)),
    r_(parse_fraction(node->attr("r"), 0.5))
{
	ASSERT_LOG(node->name() == "linearGradient" || node->name() == "radialGradient",
	           "UNRECOGNIZED GRADIENT TYPE '" << node->name() << "'");

	const std::string& units = node->attr("gradientUnits");
	if(units == "userSpaceOnUse") {
		units_ = UNITS_USER_SPACE;
	} else {
		ASSERT_LOG(units.empty() || units == "objectBoundingBox", "UNRECOGNIZED GRADIENT UNITS '" << units << "'");
	}

	FOREACH_XML_CHILD(stop_node, node, "stop") {
		std::string stop_color, stop_opacity;
		read_stop_style(stop_node, stop_color, stop_opacity);

		color c = stop_color.empty() ? color() : color::from_string(stop_color);
		if(!stop_opacity.empty()) {
			c = c.with_alpha(opacity_to_alpha(util::parse_number(stop_opacity)));
		}

		add_stop(parse_fraction(stop_node->attr("offset"), 0.0), c);
	}

	validate();
}

gradient::gradient(TYPE type, const std::string& id)
  : id_(id), type_(type), units_(UNITS_OBJECT_BOUNDING_BOX),
    x1_(0.0), y1_(0.0), x2_(1.0), y2_(0.0),
    cx_(0.5), cy_(0.5), r_(0.5)
{}

void gradient::set_line(double x1, double y1, double x2, double y2)
{
	x1_ = x1;
	y1_ = y1;
	x2_ = x2;
	y2_ = y2;
}

void gradient::set_circle(double cx, double cy, double r)
{
	cx_ = cx;
	cy_ = cy;
	r_ = r;
}

void gradient::add_stop(double offset, const color& c)
{
	ASSERT_LOG(offset >= 0.0 && offset <= 1.0, "GRADIENT STOP OFFSET OUT OF RANGE IN '" << id_ << "': " << offset);
	ASSERT_LOG(stops_.empty() || stops_.back().offset <= offset, "GRADIENT STOPS OUT OF ORDER IN '" << id_ << "'");
	stops_.push_back(stop(offset, c));
}

void gradient::validate() const
{
	ASSERT_LOG(!id_.empty(), "GRADIENT WITHOUT AN ID");
	ASSERT_LOG(!stops_.empty(), "GRADIENT '" << id_ << "' HAS NO STOPS");
	ASSERT_LOG(r_ >= 0.0, "GRADIENT '" << id_ << "' HAS NEGATIVE RADIUS");
}

gradient gradient::transformed(const scale_transform& t) const
{
	gradient res(*this);
	if(units_ == UNITS_USER_SPACE) {
		res.x1_ = t.apply_x(x1_);
		res.y1_ = t.apply_y(y1_);
		res.x2_ = t.apply_x(x2_);
		res.y2_ = t.apply_y(y2_);
		res.cx_ = t.apply_x(cx_);
		res.cy_ = t.apply_y(cy_);
		res.r_ = r_*t.length_scale();
	}

	return res;
}

xml::node_ptr gradient::write() const
{
	xml::node_ptr res(new xml::node(type_ == GRADIENT_RADIAL ? "radialGradient" : "linearGradient"));
	res->set_attr("id", id_);
	if(type_ == GRADIENT_RADIAL) {
		res->set_attr("cx", util::format_number(cx_));
		res->set_attr("cy", util::format_number(cy_));
		res->set_attr("r", util::format_number(r_));
	} else {
		res->set_attr("x1", util::format_number(x1_));
		res->set_attr("y1", util::format_number(y1_));
		res->set_attr("x2", util::format_number(x2_));
		res->set_attr("y2", util::format_number(y2_));
	}

	if(units_ == UNITS_USER_SPACE) {
		res->set_attr("gradientUnits", "userSpaceOnUse");
	}

	foreach(const stop& s, stops_) {
		xml::node_ptr stop_node(new xml::node("stop"));
		stop_node->set_attr("offset", util::format_number(s.offset));
		stop_node->set_attr("stop-color", s.col.to_string());
		if(s.col.a() != 255) {
			stop_node->set_attr("stop-opacity", util::format_number(s.col.opacity()));
		}
		res->add_child(stop_node);
	}

	return res;
}

bool operator==(const gradient& a, const gradient& b)
{
	if(a.id() != b.id() || a.type() != b.type() || a.units() != b.units() ||
	   a.stops().size() != b.stops().size()) {
		return false;
	}

	if(a.type() == gradient::GRADIENT_RADIAL) {
		if(a.cx() != b.cx() || a.cy() != b.cy() || a.r() != b.r()) {
			return false;
		}
	} else if(a.x1() != b.x1() || a.y1() != b.y1() || a.x2() != b.x2() || a.y2() != b.y2()) {
		return false;
	}

	for(int n = 0; n != a.stops().size(); ++n) {
		if(a.stops()[n].offset != b.stops()[n].offset || a.stops()[n].col != b.stops()[n].col) {
			return false;
		}
	}

	return true;
}

bool operator!=(const gradient& a, const gradient& b)
{
	return !(a == b);
}

}
