#include <cmath>

#include "asserts.hpp"
#include "foreach.hpp"
#include "icon.hpp"
#include "string_utils.hpp"
#include "xml_node.hpp"
#include "xml_utils.hpp"
#include "xml_writer.hpp"

const std::string icon::SvgNamespace = "http://www.w3.org/2000/svg";

namespace {
//width or height of the root element, or -1 if absent. Percentages mean
//"as large as the container" and leave the size to the canvas, as an
//absent value does.
double read_size(xml::const_node_ptr node, const std::string& key)
{
	const std::string str = util::strip(node->attr(key));
	if(str.empty() || util::string_ends_with(str, "%")) {
		return -1.0;
	}

	const double res = xml::get_length(node, key);
	ASSERT_LOG(res > 0.0, "ILLEGAL " << key << " OF <" << node->name() << " id=\"" << node->attr("id") << "\">: '" << str << "'");
	return res;
}

std::string write_view_box(const view_box& box)
{
	return util::format_number(box.x) + " " + util::format_number(box.y) + " " +
	       util::format_number(box.w) + " " + util::format_number(box.h);
}

bool is_ignored_element(const std::string& name)
{
	return name == "title" || name == "desc" || name == "metadata";
}

bool is_gradient_element(const std::string& name)
{
	return name == "linearGradient" || name == "radialGradient";
}
}

bool operator==(const view_box& a, const view_box& b)
{
	return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}

bool operator!=(const view_box& a, const view_box& b)
{
	return !(a == b);
}

icon::icon(xml::const_node_ptr node, const std::string& default_id)
  : id_(node->attr("id").empty() ? default_id : node->attr("id")),
    width_(read_size(node, "width")), height_(read_size(node, "height"))
{
	ASSERT_LOG(node->name() == "svg" || node->name() == "symbol",
	           "EXPECTED <svg> OR <symbol>, FOUND <" << node->name() << ">");

	const std::vector<std::string> box = util::split_list(node->attr("viewBox"));
	if(box.empty()) {
		ASSERT_LOG(width_ > 0.0 && height_ > 0.0, "ICON '" << id_ << "' HAS NEITHER A viewBox NOR A SIZE");
		canvas_ = view_box(0.0, 0.0, width_, height_);
	} else {
		ASSERT_LOG(box.size() == 4, "ILLEGAL viewBox IN ICON '" << id_ << "': '" << node->attr("viewBox") << "'");
		canvas_ = view_box(util::parse_number(box[0]), util::parse_number(box[1]),
		                   util::parse_number(box[2]), util::parse_number(box[3]));
		ASSERT_LOG(canvas_.w > 0.0 && canvas_.h > 0.0, "ICON '" << id_ << "' HAS AN EMPTY CANVAS");

		//a missing dimension follows the canvas aspect ratio.
		if(width_ <= 0.0 && height_ <= 0.0) {
			width_ = canvas_.w;
			height_ = canvas_.h;
		} else if(width_ <= 0.0) {
			width_ = height_*canvas_.w/canvas_.h;
		} else if(height_ <= 0.0) {
			height_ = width_*canvas_.h/canvas_.w;
		}
	}

	read_children(node, shape_style::read(node, shape_style()));
	validate();
}

icon::icon(const std::string& id, const view_box& canvas, double width, double height)
  : id_(id), canvas_(canvas), width_(width), height_(height)
{}

void icon::read_children(xml::const_node_ptr node, const shape_style& inherited)
{
	foreach(const xml::node_ptr& child, node->children()) {
		const std::string& name = child->name();
		ASSERT_LOG(!child->has_attr("transform"), "TRANSFORMS ARE NOT SUPPORTED: <" << name << "> IN ICON '" << id_ << "'");

		if(shape::is_shape_element(name)) {
			add_shape(shape::create(child, inherited));
		} else if(name == "g") {
			read_children(child, shape_style::read(child, inherited));
		} else if(is_gradient_element(name)) {
			add_gradient(graphics::gradient(child));
		} else if(name == "defs") {
			foreach(const xml::node_ptr& def, child->children()) {
				if(is_gradient_element(def->name())) {
					add_gradient(graphics::gradient(def));
				} else {
					ASSERT_LOG(is_ignored_element(def->name()),
					           "UNSUPPORTED DEFINITION <" << def->name() << "> IN ICON '" << id_ << "'");
				}
			}
		} else {
			ASSERT_LOG(is_ignored_element(name), "UNSUPPORTED ELEMENT <" << name << "> IN ICON '" << id_ << "'");
		}
	}
}

void icon::add_shape(const_shape_ptr s)
{
	ASSERT_LOG(s, "NULL SHAPE ADDED TO ICON '" << id_ << "'");
	shapes_.push_back(s);
}

void icon::add_gradient(const graphics::gradient& g)
{
	g.validate();
	ASSERT_LOG(get_gradient(g.id()) == NULL, "GRADIENT REPEATED IN ICON '" << id_ << "': " << g.id());
	gradients_.push_back(g);
}

const graphics::gradient* icon::get_gradient(const std::string& id) const
{
	foreach(const graphics::gradient& g, gradients_) {
		if(g.id() == id) {
			return &g;
		}
	}

	return NULL;
}

graphics::paint icon::primary_fill() const
{
	if(shapes_.empty()) {
		return graphics::paint();
	}

	return shapes_.front()->fill();
}

bounds icon::content_bounds() const
{
	bounds res;
	foreach(const const_shape_ptr& s, shapes_) {
		res.add(s->bounding_box());
	}

	return res;
}

bool icon::content_inside_canvas() const
{
	const bounds area(canvas_.x, canvas_.y, canvas_.x + canvas_.w, canvas_.y + canvas_.h);
	return area.contains(content_bounds(), 1e-9);
}

void icon::validate_paint(const graphics::paint& p) const
{
	if(p.is_reference()) {
		ASSERT_LOG(get_gradient(p.reference_id()) != NULL,
		           "ICON '" << id_ << "' REFERENCES UNDEFINED GRADIENT '" << p.reference_id() << "'");
	}
}

void icon::validate() const
{
	ASSERT_LOG(!id_.empty(), "ICON WITHOUT AN ID");
	ASSERT_LOG(canvas_.w > 0.0 && canvas_.h > 0.0, "ICON '" << id_ << "' HAS AN EMPTY CANVAS");
	ASSERT_LOG(width_ > 0.0 && height_ > 0.0, "ICON '" << id_ << "' HAS AN ILLEGAL SIZE: " << width_ << "x" << height_);

	const double canvas_aspect = canvas_.w/canvas_.h;
	ASSERT_LOG(std::fabs(width_/height_ - canvas_aspect) <= 1e-6*canvas_aspect,
	           "ICON '" << id_ << "' SIZE " << width_ << "x" << height_ << " DOES NOT MATCH ITS CANVAS " << canvas_.w << "x" << canvas_.h);

	ASSERT_LOG(!shapes_.empty(), "ICON '" << id_ << "' HAS NO SHAPES");
	for(int n = 0; n != shapes_.size(); ++n) {
		const shape& s = *shapes_[n];
		ASSERT_LOG(s.paints_something(), "SHAPE " << n << " (" << s.type() << ") OF ICON '" << id_ << "' HAS NEITHER FILL NOR STROKE");
		validate_paint(s.fill());
		validate_paint(s.stroke());
	}
}

void icon::write_body(xml::node& node) const
{
	if(!gradients_.empty()) {
		xml::node_ptr defs(new xml::node("defs"));
		foreach(const graphics::gradient& g, gradients_) {
			defs->add_child(g.write());
		}
		node.add_child(defs);
	}

	foreach(const const_shape_ptr& s, shapes_) {
		node.add_child(s->write());
	}
}

xml::node_ptr icon::write() const
{
	xml::node_ptr res(new xml::node("svg"));
	res->set_attr("xmlns", SvgNamespace);
	res->set_attr("id", id_);
	res->set_attr("viewBox", write_view_box(canvas_));
	res->set_attr("width", util::format_number(width_));
	res->set_attr("height", util::format_number(height_));
	write_body(*res);
	return res;
}

xml::node_ptr icon::write_symbol() const
{
	xml::node_ptr res(new xml::node("symbol"));
	res->set_attr("id", id_);
	res->set_attr("viewBox", write_view_box(canvas_));
	res->set_attr("width", util::format_number(width_));
	res->set_attr("height", util::format_number(height_));
	write_body(*res);
	return res;
}

std::string icon::to_svg() const
{
	return xml::output_xml(write());
}

const_icon_ptr icon::scaled(double w, double h) const
{
	ASSERT_LOG(w > 0.0 && h > 0.0, "ILLEGAL SIZE FOR ICON '" << id_ << "': " << w << "x" << h);

	const double sx = w/canvas_.w;
	const double sy = h/canvas_.h;
	const scale_transform t(sx, sy, -canvas_.x*sx, -canvas_.y*sy);

	icon_ptr res(new icon(id_, view_box(0.0, 0.0, w, h), w, h));
	foreach(const graphics::gradient& g, gradients_) {
		res->add_gradient(g.transformed(t));
	}

	foreach(const const_shape_ptr& s, shapes_) {
		res->add_shape(s->transformed(t));
	}

	return res;
}

bool operator==(const icon& a, const icon& b)
{
	if(a.id() != b.id() || a.canvas() != b.canvas() ||
	   a.width() != b.width() || a.height() != b.height() ||
	   a.gradients() != b.gradients() || a.shapes().size() != b.shapes().size()) {
		return false;
	}

	for(int n = 0; n != a.shapes().size(); ++n) {
		if(!a.shapes()[n]->equals(*b.shapes()[n])) {
			return false;
		}
	}

	return true;
}

bool operator!=(const icon& a, const icon& b)
{
	return !(a == b);
}
