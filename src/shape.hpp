#ifndef SHAPE_HPP_INCLUDED
#define SHAPE_HPP_INCLUDED

#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>

#include "geometry.hpp"
#include "paint.hpp"
#include "path_data.hpp"
#include "xml_node_fwd.hpp"

class shape;
typedef boost::shared_ptr<const shape> const_shape_ptr;

//fill and stroke of a shape. Defaults are SVG's: black fill, no stroke.
struct shape_style {
	shape_style();

	//the presentation attributes of node, and its style="" declarations,
	//applied on top of the inherited values.
	static shape_style read(xml::const_node_ptr node, const shape_style& inherited);

	void write(xml::node& node) const;

	graphics::paint fill, stroke;

	//fill-opacity and stroke-opacity as alpha values. They inherit apart
	//from the paints; a color paint carries the matching alpha.
	int fill_alpha, stroke_alpha;

	double stroke_width;
	double opacity;
};

bool operator==(const shape_style& a, const shape_style& b);
bool operator!=(const shape_style& a, const shape_style& b);

class shape
{
public:
	//builds the shape for a circle, ellipse, rect, line, polyline, polygon,
	//path or text element.
	static const_shape_ptr create(xml::const_node_ptr node, const shape_style& inherited=shape_style());
	static bool is_shape_element(const std::string& name);

	virtual ~shape();

	//the SVG element name.
	virtual const char* type() const = 0;

	const shape_style& style() const { return style_; }
	const graphics::paint& fill() const { return style_.fill; }
	const graphics::paint& stroke() const { return style_.stroke; }
	double stroke_width() const { return style_.stroke_width; }

	//false for shapes such as lines that a fill does not cover.
	virtual bool has_interior() const { return true; }

	//true if the fill or the stroke would put anything on the canvas.
	bool paints_something() const;

	virtual bounds bounding_box() const = 0;

	//copy with all geometry mapped through t. Scale factors must be
	//positive.
	virtual const_shape_ptr transformed(const scale_transform& t) const = 0;

	xml::node_ptr write() const;

	bool equals(const shape& o) const;

protected:
	explicit shape(const shape_style& style);

	shape_style transformed_style(const scale_transform& t) const;

private:
	virtual void write_geometry(xml::node& node) const = 0;
	virtual bool same_geometry(const shape& o) const = 0;

	shape_style style_;
};

class circle_shape : public shape
{
public:
	circle_shape(xml::const_node_ptr node, const shape_style& style);
	circle_shape(const point& center, double r, const shape_style& style);

	const char* type() const { return "circle"; }
	const point& center() const { return center_; }
	double radius() const { return r_; }

	bounds bounding_box() const;
	const_shape_ptr transformed(const scale_transform& t) const;
private:
	void write_geometry(xml::node& node) const;
	bool same_geometry(const shape& o) const;

	point center_;
	double r_;
};

class ellipse_shape : public shape
{
public:
	ellipse_shape(xml::const_node_ptr node, const shape_style& style);
	ellipse_shape(const point& center, double rx, double ry, const shape_style& style);

	const char* type() const { return "ellipse"; }
	const point& center() const { return center_; }
	double rx() const { return rx_; }
	double ry() const { return ry_; }

	bounds bounding_box() const;
	const_shape_ptr transformed(const scale_transform& t) const;
private:
	void write_geometry(xml::node& node) const;
	bool same_geometry(const shape& o) const;

	point center_;
	double rx_, ry_;
};

class rect_shape : public shape
{
public:
	rect_shape(xml::const_node_ptr node, const shape_style& style);
	rect_shape(double x, double y, double w, double h, const shape_style& style, double rx=0.0, double ry=0.0);

	const char* type() const { return "rect"; }
	double x() const { return x_; }
	double y() const { return y_; }
	double w() const { return w_; }
	double h() const { return h_; }
	double rx() const { return rx_; }
	double ry() const { return ry_; }

	bounds bounding_box() const;
	const_shape_ptr transformed(const scale_transform& t) const;
private:
	void write_geometry(xml::node& node) const;
	bool same_geometry(const shape& o) const;

	double x_, y_, w_, h_, rx_, ry_;
};

class line_shape : public shape
{
public:
	line_shape(xml::const_node_ptr node, const shape_style& style);
	line_shape(const point& p1, const point& p2, const shape_style& style);

	const char* type() const { return "line"; }
	const point& p1() const { return p1_; }
	const point& p2() const { return p2_; }

	bool has_interior() const { return false; }
	bounds bounding_box() const;
	const_shape_ptr transformed(const scale_transform& t) const;
private:
	void write_geometry(xml::node& node) const;
	bool same_geometry(const shape& o) const;

	point p1_, p2_;
};

//polygon when closed, polyline otherwise.
class poly_shape : public shape
{
public:
	poly_shape(xml::const_node_ptr node, const shape_style& style);
	poly_shape(const std::vector<point>& points, bool closed, const shape_style& style);

	const char* type() const { return closed_ ? "polygon" : "polyline"; }
	const std::vector<point>& points() const { return points_; }
	bool closed() const { return closed_; }

	bounds bounding_box() const;
	const_shape_ptr transformed(const scale_transform& t) const;
private:
	void write_geometry(xml::node& node) const;
	bool same_geometry(const shape& o) const;
	void validate() const;

	std::vector<point> points_;
	bool closed_;
};

class path_shape : public shape
{
public:
	path_shape(xml::const_node_ptr node, const shape_style& style);
	path_shape(const path_data& data, const shape_style& style);

	const char* type() const { return "path"; }
	const path_data& data() const { return data_; }

	bounds bounding_box() const;
	const_shape_ptr transformed(const scale_transform& t) const;
private:
	void write_geometry(xml::node& node) const;
	bool same_geometry(const shape& o) const;

	path_data data_;
};

class text_shape : public shape
{
public:
	text_shape(xml::const_node_ptr node, const shape_style& style);
	text_shape(const point& pos, const std::string& text, double font_size, const shape_style& style);

	const char* type() const { return "text"; }
	const point& pos() const { return pos_; }
	const std::string& text() const { return text_; }
	double font_size() const { return font_size_; }

	//text-anchor, dominant-baseline, font-family and font-weight, as
	//written in the source; empty when not set.
	const std::string& anchor() const { return anchor_; }
	const std::string& baseline() const { return baseline_; }
	const std::string& font_family() const { return font_family_; }
	const std::string& font_weight() const { return font_weight_; }

	void set_anchor(const std::string& anchor) { anchor_ = anchor; }
	void set_baseline(const std::string& baseline) { baseline_ = baseline; }
	void set_font_family(const std::string& family) { font_family_ = family; }
	void set_font_weight(const std::string& weight) { font_weight_ = weight; }

	//estimate only; glyph metrics belong to the renderer.
	bounds bounding_box() const;
	const_shape_ptr transformed(const scale_transform& t) const;
private:
	void write_geometry(xml::node& node) const;
	bool same_geometry(const shape& o) const;

	point pos_;
	std::string text_;
	double font_size_;
	std::string anchor_, baseline_, font_family_, font_weight_;
};

#endif
