#ifndef ICON_HPP_INCLUDED
#define ICON_HPP_INCLUDED

#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>

#include "geometry.hpp"
#include "gradient.hpp"
#include "shape.hpp"
#include "xml_node_fwd.hpp"

class icon;
typedef boost::shared_ptr<icon> icon_ptr;
typedef boost::shared_ptr<const icon> const_icon_ptr;

//the logical coordinate space shapes are drawn in.
struct view_box {
	view_box() : x(0.0), y(0.0), w(0.0), h(0.0) {}
	view_box(double xpos, double ypos, double width, double height)
	  : x(xpos), y(ypos), w(width), h(height) {}
	double x, y, w, h;
};

bool operator==(const view_box& a, const view_box& b);
bool operator!=(const view_box& a, const view_box& b);

//a single self-contained vector icon: a canvas, the shapes painted on it
//in order, gradients those shapes may reference, and the size it is
//meant to be displayed at.
class icon
{
public:
	static const std::string SvgNamespace;

	//reads an <svg> or <symbol> element. default_id names the icon when
	//the element has no id attribute.
	explicit icon(xml::const_node_ptr node, const std::string& default_id="");
	icon(const std::string& id, const view_box& canvas, double width, double height);

	void add_shape(const_shape_ptr s);
	void add_gradient(const graphics::gradient& g);

	const std::string& id() const { return id_; }
	const view_box& canvas() const { return canvas_; }
	double width() const { return width_; }
	double height() const { return height_; }

	const std::vector<const_shape_ptr>& shapes() const { return shapes_; }
	const std::vector<graphics::gradient>& gradients() const { return gradients_; }

	//null if the icon defines no gradient with this id.
	const graphics::gradient* get_gradient(const std::string& id) const;

	//fill of the bottom-most shape; none for an icon without shapes.
	graphics::paint primary_fill() const;

	bounds content_bounds() const;
	bool content_inside_canvas() const;

	//throws validation_failure_exception describing the first broken
	//rule: empty id, bad canvas or size, a shape that paints nothing, or a
	//paint reference to a gradient this icon does not define.
	void validate() const;

	xml::node_ptr write() const;
	xml::node_ptr write_symbol() const;
	std::string to_svg() const;

	//copy fitted to a w x h canvas displayed at w x h.
	const_icon_ptr scaled(double w, double h) const;

private:
	void read_children(xml::const_node_ptr node, const shape_style& inherited);
	void write_body(xml::node& node) const;
	void validate_paint(const graphics::paint& p) const;

	std::string id_;
	view_box canvas_;
	double width_, height_;
	std::vector<const_shape_ptr> shapes_;
	std::vector<graphics::gradient> gradients_;
};

bool operator==(const icon& a, const icon& b);
bool operator!=(const icon& a, const icon& b);

#endif
