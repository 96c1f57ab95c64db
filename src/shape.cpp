#include <cmath>

#include "asserts.hpp"
#include "foreach.hpp"
#include "shape.hpp"
#include "string_utils.hpp"
#include "xml_node.hpp"
#include "xml_utils.hpp"

namespace {
const double DefaultFontSize = 16.0;

//opacities are applied once all declarations have been read.
struct pending_opacity {
	std::string opacity, fill_opacity, stroke_opacity;
};

void apply_property(shape_style& style, const std::string& key, const std::string& value,
                    pending_opacity& pending)
{
	if(key == "fill") {
		style.fill = graphics::paint::from_string(value);
	} else if(key == "stroke") {
		style.stroke = graphics::paint::from_string(value);
	} else if(key == "stroke-width") {
		std::string str = util::strip(value);
		if(util::string_ends_with(str, "px")) {
			str.resize(str.size() - 2);
		}
		style.stroke_width = util::parse_number(str);
		ASSERT_LOG(style.stroke_width >= 0.0, "NEGATIVE STROKE WIDTH: '" << value << "'");
	} else if(key == "opacity") {
		pending.opacity = value;
	} else if(key == "fill-opacity") {
		pending.fill_opacity = value;
	} else if(key == "stroke-opacity") {
		pending.stroke_opacity = value;
	}
}

std::vector<point> read_points(const std::string& str)
{
	const std::vector<std::string> items = util::split_list(str);
	ASSERT_LOG(items.size()%2 == 0, "ODD NUMBER OF COORDINATES IN POINTS: '" << str << "'");

	std::vector<point> res;
	for(int n = 0; n != items.size(); n += 2) {
		res.push_back(point(util::parse_number(items[n]), util::parse_number(items[n+1])));
	}

	return res;
}

std::string write_points(const std::vector<point>& points)
{
	std::string res;
	foreach(const point& p, points) {
		if(!res.empty()) {
			res += " ";
		}
		res += util::format_number(p.x) + "," + util::format_number(p.y);
	}

	return res;
}

void set_number(xml::node& node, const std::string& key, double value)
{
	node.set_attr(key, util::format_number(value));
}
}

shape_style::shape_style()
  : fill(graphics::color(0, 0, 0)), fill_alpha(255), stroke_alpha(255),
    stroke_width(1.0), opacity(1.0)
{}

shape_style shape_style::read(xml::const_node_ptr node, const shape_style& inherited)
{
	static const char* Properties[] = {
		"fill", "stroke", "stroke-width", "opacity", "fill-opacity", "stroke-opacity",
	};

	shape_style res = inherited;

	pending_opacity pending;
	foreach(const char* prop, Properties) {
		if(node->has_attr(prop)) {
			apply_property(res, prop, node->attr(prop), pending);
		}
	}

	foreach(const std::string& decl, util::split(node->attr("style"), ';')) {
		const std::string::size_type colon = decl.find(':');
		ASSERT_LOG(colon != std::string::npos, "ILLEGAL STYLE DECLARATION: '" << decl << "'");
		apply_property(res, util::strip(decl.substr(0, colon)), util::strip(decl.substr(colon+1)), pending);
	}

	//group opacity multiplies into the opacity of everything inside.
	if(!pending.opacity.empty()) {
		const double opacity = util::parse_number(pending.opacity);
		ASSERT_LOG(opacity >= 0.0 && opacity <= 1.0, "OPACITY OUT OF RANGE: '" << pending.opacity << "'");
		res.opacity = inherited.opacity*opacity;
	}

	if(!pending.fill_opacity.empty()) {
		res.fill_alpha = graphics::opacity_to_alpha(util::parse_number(pending.fill_opacity));
	}

	if(!pending.stroke_opacity.empty()) {
		res.stroke_alpha = graphics::opacity_to_alpha(util::parse_number(pending.stroke_opacity));
	}

	res.fill = res.fill.with_alpha(res.fill_alpha);
	res.stroke = res.stroke.with_alpha(res.stroke_alpha);
	return res;
}

void shape_style::write(xml::node& node) const
{
	node.set_attr("fill", fill.to_string());
	if(fill_alpha != 255) {
		set_number(node, "fill-opacity", fill_alpha/255.0);
	}

	if(!stroke.is_none()) {
		node.set_attr("stroke", stroke.to_string());
	}

	if(stroke_alpha != 255) {
		set_number(node, "stroke-opacity", stroke_alpha/255.0);
	}

	if(!stroke.is_none() || stroke_width != 1.0) {
		set_number(node, "stroke-width", stroke_width);
	}

	if(opacity != 1.0) {
		set_number(node, "opacity", opacity);
	}
}

bool operator==(const shape_style& a, const shape_style& b)
{
	return a.fill == b.fill && a.stroke == b.stroke &&
	       a.fill_alpha == b.fill_alpha && a.stroke_alpha == b.stroke_alpha &&
	       a.stroke_width == b.stroke_width && a.opacity == b.opacity;
}

bool operator!=(const shape_style& a, const shape_style& b)
{
	return !(a == b);
}

const_shape_ptr shape::create(xml::const_node_ptr node, const shape_style& inherited)
{
	const shape_style style = shape_style::read(node, inherited);
	const std::string& type = node->name();
	if(type == "circle") {
		return const_shape_ptr(new circle_shape(node, style));
	} else if(type == "ellipse") {
		return const_shape_ptr(new ellipse_shape(node, style));
	} else if(type == "rect") {
		return const_shape_ptr(new rect_shape(node, style));
	} else if(type == "line") {
		return const_shape_ptr(new line_shape(node, style));
	} else if(type == "polyline" || type == "polygon") {
		return const_shape_ptr(new poly_shape(node, style));
	} else if(type == "path") {
		return const_shape_ptr(new path_shape(node, style));
	} else if(type == "text") {
		return const_shape_ptr(new text_shape(node, style));
	}

	ASSERT_FAILED("UNRECOGNIZED SHAPE TYPE '" << type << "'");
}

bool shape::is_shape_element(const std::string& name)
{
	return name == "circle" || name == "ellipse" || name == "rect" || name == "line" ||
	       name == "polyline" || name == "polygon" || name == "path" || name == "text";
}

shape::shape(const shape_style& style) : style_(style)
{}

shape::~shape()
{}

bool shape::paints_something() const
{
	if(style_.opacity == 0.0) {
		return false;
	}

	if(has_interior() && !style_.fill.is_none()) {
		return true;
	}

	return !style_.stroke.is_none() && style_.stroke_width > 0.0;
}

xml::node_ptr shape::write() const
{
	xml::node_ptr res(new xml::node(type()));
	write_geometry(*res);
	style_.write(*res);
	return res;
}

bool shape::equals(const shape& o) const
{
	return std::string(type()) == o.type() && style_ == o.style_ && same_geometry(o);
}

shape_style shape::transformed_style(const scale_transform& t) const
{
	shape_style res = style_;
	res.stroke_width *= t.length_scale();
	return res;
}

circle_shape::circle_shape(xml::const_node_ptr node, const shape_style& style)
  : shape(style),
    center_(xml::get_length(node, "cx"), xml::get_length(node, "cy")),
    r_(xml::get_length(node, "r"))
{
	ASSERT_LOG(r_ >= 0.0, "NEGATIVE CIRCLE RADIUS: " << r_);
}

circle_shape::circle_shape(const point& center, double r, const shape_style& style)
  : shape(style), center_(center), r_(r)
{
	ASSERT_LOG(r_ >= 0.0, "NEGATIVE CIRCLE RADIUS: " << r_);
}

bounds circle_shape::bounding_box() const
{
	return bounds(center_.x - r_, center_.y - r_, center_.x + r_, center_.y + r_);
}

const_shape_ptr circle_shape::transformed(const scale_transform& t) const
{
	if(t.is_uniform()) {
		return const_shape_ptr(new circle_shape(t.apply(center_), r_*t.sx, transformed_style(t)));
	}

	return const_shape_ptr(new ellipse_shape(t.apply(center_), r_*t.sx, r_*t.sy, transformed_style(t)));
}

void circle_shape::write_geometry(xml::node& node) const
{
	set_number(node, "cx", center_.x);
	set_number(node, "cy", center_.y);
	set_number(node, "r", r_);
}

bool circle_shape::same_geometry(const shape& o) const
{
	const circle_shape* c = dynamic_cast<const circle_shape*>(&o);
	return c && c->center_ == center_ && c->r_ == r_;
}

ellipse_shape::ellipse_shape(xml::const_node_ptr node, const shape_style& style)
  : shape(style),
    center_(xml::get_length(node, "cx"), xml::get_length(node, "cy")),
    rx_(xml::get_length(node, "rx")), ry_(xml::get_length(node, "ry"))
{
	ASSERT_LOG(rx_ >= 0.0 && ry_ >= 0.0, "NEGATIVE ELLIPSE RADIUS: " << rx_ << "," << ry_);
}

ellipse_shape::ellipse_shape(const point& center, double rx, double ry, const shape_style& style)
  : shape(style), center_(center), rx_(rx), ry_(ry)
{
	ASSERT_LOG(rx_ >= 0.0 && ry_ >= 0.0, "NEGATIVE ELLIPSE RADIUS: " << rx_ << "," << ry_);
}

bounds ellipse_shape::bounding_box() const
{
	return bounds(center_.x - rx_, center_.y - ry_, center_.x + rx_, center_.y + ry_);
}

const_shape_ptr ellipse_shape::transformed(const scale_transform& t) const
{
	return const_shape_ptr(new ellipse_shape(t.apply(center_), rx_*t.sx, ry_*t.sy, transformed_style(t)));
}

void ellipse_shape::write_geometry(xml::node& node) const
{
	set_number(node, "cx", center_.x);
	set_number(node, "cy", center_.y);
	set_number(node, "rx", rx_);
	set_number(node, "ry", ry_);
}

bool ellipse_shape::same_geometry(const shape& o) const
{
	const ellipse_shape* e = dynamic_cast<const ellipse_shape*>(&o);
	return e && e->center_ == center_ && e->rx_ == rx_ && e->ry_ == ry_;
}

rect_shape::rect_shape(xml::const_node_ptr node, const shape_style& style)
  : shape(style),
    x_(xml::get_length(node, "x")), y_(xml::get_length(node, "y")),
    w_(xml::get_length(node, "width")), h_(xml::get_length(node, "height")),
    rx_(xml::get_length(node, "rx")), ry_(xml::get_length(node, "ry"))
{
	//a single corner radius applies to both axes.
	if(!node->has_attr("ry")) {
		ry_ = rx_;
	} else if(!node->has_attr("rx")) {
		rx_ = ry_;
	}

	ASSERT_LOG(w_ >= 0.0 && h_ >= 0.0, "NEGATIVE RECT SIZE: " << w_ << "x" << h_);
	ASSERT_LOG(rx_ >= 0.0 && ry_ >= 0.0, "NEGATIVE RECT CORNER RADIUS");
}

rect_shape::rect_shape(double x, double y, double w, double h, const shape_style& style, double rx, double ry)
  : shape(style), x_(x), y_(y), w_(w), h_(h), rx_(rx), ry_(ry)
{
	ASSERT_LOG(w_ >= 0.0 && h_ >= 0.0, "NEGATIVE RECT SIZE: " << w_ << "x" << h_);
	ASSERT_LOG(rx_ >= 0.0 && ry_ >= 0.0, "NEGATIVE RECT CORNER RADIUS");
}

bounds rect_shape::bounding_box() const
{
	return bounds(x_, y_, x_ + w_, y_ + h_);
}

const_shape_ptr rect_shape::transformed(const scale_transform& t) const
{
	return const_shape_ptr(new rect_shape(t.apply_x(x_), t.apply_y(y_), w_*t.sx, h_*t.sy,
	                                      transformed_style(t), rx_*t.sx, ry_*t.sy));
}

void rect_shape::write_geometry(xml::node& node) const
{
	set_number(node, "x", x_);
	set_number(node, "y", y_);
	set_number(node, "width", w_);
	set_number(node, "height", h_);
	if(rx_ != 0.0 || ry_ != 0.0) {
		set_number(node, "rx", rx_);
		set_number(node, "ry", ry_);
	}
}

bool rect_shape::same_geometry(const shape& o) const
{
	const rect_shape* r = dynamic_cast<const rect_shape*>(&o);
	return r && r->x_ == x_ && r->y_ == y_ && r->w_ == w_ && r->h_ == h_ &&
	       r->rx_ == rx_ && r->ry_ == ry_;
}

line_shape::line_shape(xml::const_node_ptr node, const shape_style& style)
  : shape(style),
    p1_(xml::get_length(node, "x1"), xml::get_length(node, "y1")),
    p2_(xml::get_length(node, "x2"), xml::get_length(node, "y2"))
{}

line_shape::line_shape(const point& p1, const point& p2, const shape_style& style)
  : shape(style), p1_(p1), p2_(p2)
{}

bounds line_shape::bounding_box() const
{
	return bounds(p1_.x, p1_.y, p2_.x, p2_.y);
}

const_shape_ptr line_shape::transformed(const scale_transform& t) const
{
	return const_shape_ptr(new line_shape(t.apply(p1_), t.apply(p2_), transformed_style(t)));
}

void line_shape::write_geometry(xml::node& node) const
{
	set_number(node, "x1", p1_.x);
	set_number(node, "y1", p1_.y);
	set_number(node, "x2", p2_.x);
	set_number(node, "y2", p2_.y);
}

bool line_shape::same_geometry(const shape& o) const
{
	const line_shape* l = dynamic_cast<const line_shape*>(&o);
	return l && l->p1_ == p1_ && l->p2_ == p2_;
}

poly_shape::poly_shape(xml::const_node_ptr node, const shape_style& style)
  : shape(style), points_(read_points(node->attr("points"))), closed_(node->name() == "polygon")
{
	validate();
}

poly_shape::poly_shape(const std::vector<point>& points, bool closed, const shape_style& style)
  : shape(style), points_(points), closed_(closed)
{
	validate();
}

void poly_shape::validate() const
{
	if(closed_) {
		ASSERT_LOG(points_.size() >= 3, "POLYGON NEEDS AT LEAST 3 POINTS, HAS " << points_.size());
	} else {
		ASSERT_LOG(points_.size() >= 2, "POLYLINE NEEDS AT LEAST 2 POINTS, HAS " << points_.size());
	}
}

bounds poly_shape::bounding_box() const
{
	bounds res;
	foreach(const point& p, points_) {
		res.add(p);
	}

	return res;
}

const_shape_ptr poly_shape::transformed(const scale_transform& t) const
{
	std::vector<point> points;
	foreach(const point& p, points_) {
		points.push_back(t.apply(p));
	}

	return const_shape_ptr(new poly_shape(points, closed_, transformed_style(t)));
}

void poly_shape::write_geometry(xml::node& node) const
{
	node.set_attr("points", write_points(points_));
}

bool poly_shape::same_geometry(const shape& o) const
{
	const poly_shape* p = dynamic_cast<const poly_shape*>(&o);
	if(!p || p->closed_ != closed_ || p->points_.size() != points_.size()) {
		return false;
	}

	for(int n = 0; n != points_.size(); ++n) {
		if(p->points_[n] != points_[n]) {
			return false;
		}
	}

	return true;
}

path_shape::path_shape(xml::const_node_ptr node, const shape_style& style)
  : shape(style), data_(node->attr("d"))
{
	ASSERT_LOG(!data_.empty(), "PATH WITHOUT DATA");
}

path_shape::path_shape(const path_data& data, const shape_style& style)
  : shape(style), data_(data)
{
	ASSERT_LOG(!data_.empty(), "PATH WITHOUT DATA");
}

bounds path_shape::bounding_box() const
{
	return data_.bounding_box();
}

const_shape_ptr path_shape::transformed(const scale_transform& t) const
{
	return const_shape_ptr(new path_shape(data_.transformed(t), transformed_style(t)));
}

void path_shape::write_geometry(xml::node& node) const
{
	node.set_attr("d", data_.to_string());
}

bool path_shape::same_geometry(const shape& o) const
{
	const path_shape* p = dynamic_cast<const path_shape*>(&o);
	return p && p->data_ == data_;
}

text_shape::text_shape(xml::const_node_ptr node, const shape_style& style)
  : shape(style),
    pos_(xml::get_length(node, "x"), xml::get_length(node, "y")),
    text_(node->text()),
    font_size_(xml::get_length(node, "font-size", DefaultFontSize)),
    anchor_(node->attr("text-anchor")),
    baseline_(node->attr("dominant-baseline")),
    font_family_(node->attr("font-family")),
    font_weight_(node->attr("font-weight"))
{
	ASSERT_LOG(!util::strip(text_).empty(), "TEXT ELEMENT WITHOUT TEXT");
	ASSERT_LOG(font_size_ > 0.0, "ILLEGAL FONT SIZE: " << font_size_);
}

text_shape::text_shape(const point& pos, const std::string& text, double font_size, const shape_style& style)
  : shape(style), pos_(pos), text_(text), font_size_(font_size)
{
	ASSERT_LOG(!text_.empty(), "TEXT ELEMENT WITHOUT TEXT");
	ASSERT_LOG(font_size_ > 0.0, "ILLEGAL FONT SIZE: " << font_size_);
}

bounds text_shape::bounding_box() const
{
	const double width = font_size_*0.6*text_.size();
	double x1 = pos_.x;
	if(anchor_ == "middle") {
		x1 -= width/2.0;
	} else if(anchor_ == "end") {
		x1 -= width;
	}

	double y1 = pos_.y - font_size_*0.8;
	if(baseline_ == "central" || baseline_ == "middle") {
		y1 = pos_.y - font_size_/2.0;
	}

	return bounds(x1, y1, x1 + width, y1 + font_size_);
}

const_shape_ptr text_shape::transformed(const scale_transform& t) const
{
	text_shape* res = new text_shape(t.apply(pos_), text_, font_size_*t.sy, transformed_style(t));
	res->anchor_ = anchor_;
	res->baseline_ = baseline_;
	res->font_family_ = font_family_;
	res->font_weight_ = font_weight_;
	return const_shape_ptr(res);
}

void text_shape::write_geometry(xml::node& node) const
{
	set_number(node, "x", pos_.x);
	set_number(node, "y", pos_.y);
	set_number(node, "font-size", font_size_);
	if(!anchor_.empty()) {
		node.set_attr("text-anchor", anchor_);
	}

	if(!baseline_.empty()) {
		node.set_attr("dominant-baseline", baseline_);
	}

	if(!font_family_.empty()) {
		node.set_attr("font-family", font_family_);
	}

	if(!font_weight_.empty()) {
		node.set_attr("font-weight", font_weight_);
	}

	node.set_text(text_);
}

bool text_shape::same_geometry(const shape& o) const
{
	const text_shape* t = dynamic_cast<const text_shape*>(&o);
	return t && t->pos_ == pos_ && t->text_ == text_ && t->font_size_ == font_size_ &&
	       t->anchor_ == anchor_ && t->baseline_ == baseline_ &&
	       t->font_family_ == font_family_ && t->font_weight_ == font_weight_;
}
