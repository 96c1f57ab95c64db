#include <cmath>

#include "asserts.hpp"
#include "builtin_icons.hpp"
#include "foreach.hpp"
#include "icon_catalog.hpp"

namespace builtin_icons {

namespace {
const double Pi = 3.14159265358979323846;
const double CanvasSize = 100.0;
const point Center(50.0, 50.0);
//min(w,h)/2 - 2, leaving room for the border.
const double Radius = 48.0;

const graphics::color White(255, 255, 255);
const graphics::color Gold(255, 215, 0);

//coordinates are kept to 3 decimals so the written icons stay short.
double snap(double value)
{
	return std::floor(value*1000.0 + 0.5)/1000.0;
}

point polar(double r, double angle)
{
	return point(snap(Center.x + r*std::cos(angle)), snap(Center.y + r*std::sin(angle)));
}

shape_style fill_style(const graphics::color& c)
{
	shape_style res;
	res.fill = graphics::paint(c);
	return res;
}

shape_style stroke_style(const graphics::color& c, double width)
{
	shape_style res;
	res.fill = graphics::paint();
	res.stroke = graphics::paint(c);
	res.stroke_width = width;
	return res;
}

const_shape_ptr circle(const point& p, double r, const shape_style& style)
{
	return const_shape_ptr(new circle_shape(p, snap(r), style));
}

//arc of the circle around the centre, running counter-clockwise on
//screen from start to end (radians, y axis pointing up).
const_shape_ptr arc(double r, double start, double end, const shape_style& style)
{
	r = snap(r);
	const point p0(snap(Center.x + r*std::cos(start)), snap(Center.y - r*std::sin(start)));
	const point p1(snap(Center.x + r*std::cos(end)), snap(Center.y - r*std::sin(end)));

	std::vector<double> move_args;
	move_args.push_back(p0.x);
	move_args.push_back(p0.y);

	std::vector<double> arc_args;
	arc_args.push_back(r);
	arc_args.push_back(r);
	arc_args.push_back(0.0);
	arc_args.push_back(end - start > Pi + 1e-9 ? 1.0 : 0.0);
	arc_args.push_back(0.0);
	arc_args.push_back(p1.x);
	arc_args.push_back(p1.y);

	path_data data;
	data.add_command('M', move_args);
	data.add_command('A', arc_args);
	return const_shape_ptr(new path_shape(data, style));
}

void draw_stone(icon& ic, const graphics::color& c)
{
	std::vector<point> points;
	for(int i = 0; i != 7; ++i) {
		points.push_back(polar(Radius*(0.6 + 0.2*(i%3)), 2.0*Pi*i/7.0));
	}

	ic.add_shape(const_shape_ptr(new poly_shape(points, true, fill_style(c.lighten(30)))));
}

void draw_iron(icon& ic, const graphics::color& c)
{
	const double w = snap(Radius*1.2);
	const double h = snap(Radius*0.8);
	shape_style style = fill_style(c.lighten(30));
	style.stroke = graphics::paint(c.darken(40));
	style.stroke_width = 1.0;
	ic.add_shape(const_shape_ptr(new rect_shape(Center.x - std::floor(w/2.0), Center.y - std::floor(h/2.0), w, h, style)));
}

void draw_copper(icon& ic, const graphics::color& c)
{
	std::vector<point> points;
	for(int i = 0; i != 6; ++i) {
		points.push_back(polar(Radius*0.7, 2.0*Pi*i/6.0));
	}

	ic.add_shape(const_shape_ptr(new poly_shape(points, true, fill_style(c.lighten(40)))));
	ic.add_shape(circle(Center, 12.0, fill_style(c.lighten(60))));
}

void draw_thorium(icon& ic, const graphics::color& c)
{
	const shape_style style = fill_style(c.lighten(60));
	for(int i = 0; i != 3; ++i) {
		const double angle = 2.0*Pi*i/3.0;
		const double offset = Radius*0.4;
		//whole units, truncated.
		const point p(static_cast<int>(Center.x + offset*std::cos(angle)),
		              static_cast<int>(Center.y + offset*std::sin(angle)));
		ic.add_shape(circle(p, 9.0, style));
	}

	ic.add_shape(circle(Center, 12.0, style));
}

void draw_monster_coin(icon& ic, const graphics::color& c)
{
	ic.add_shape(const_shape_ptr(new ellipse_shape(Center, 24.0, 24.0, fill_style(graphics::color(139, 0, 0)))));
	ic.add_shape(circle(point(38.0, 42.0), 8.0, fill_style(White)));
	ic.add_shape(circle(point(62.0, 42.0), 8.0, fill_style(White)));
}

void draw_force_core(icon& ic, const graphics::color& c)
{
	std::vector<point> points;
	points.push_back(point(26.0, 34.0));
	points.push_back(point(74.0, 50.0));
	points.push_back(point(26.0, 66.0));
	ic.add_shape(const_shape_ptr(new poly_shape(points, true, fill_style(White))));
}

void draw_spirit_core(icon& ic, const graphics::color& c)
{
	std::vector<point> points;
	for(int i = 0; i != 6; ++i) {
		const double t = i/5.0;
		points.push_back(point(snap(Center.x - 24.0 + Radius*t), snap(Center.y + 16.0*std::sin(t*Pi))));
	}

	ic.add_shape(const_shape_ptr(new poly_shape(points, false, stroke_style(graphics::color(224, 255, 255), 3.0))));
}

void draw_magic_core(icon& ic, const graphics::color& c)
{
	std::vector<point> points;
	for(int i = 0; i != 10; ++i) {
		const double r = Radius*(i%2 == 0 ? 0.7 : 0.4);
		points.push_back(polar(r, Pi/2.0 + 2.0*Pi*i/10.0));
	}

	ic.add_shape(const_shape_ptr(new poly_shape(points, true, fill_style(Gold))));
}

void draw_void_core(icon& ic, const graphics::color& c)
{
	const shape_style style = stroke_style(c.lighten(120), 2.0);
	for(int i = 0; i != 4; ++i) {
		ic.add_shape(arc(Radius*(0.8 - i*0.15), i*Pi/2.0, (i + 1)*Pi/2.0, style));
	}

	ic.add_shape(circle(Center, 16.0, fill_style(c)));
}

void draw_unstoppable_force(icon& ic, const graphics::color& c)
{
	ic.add_shape(const_shape_ptr(new ellipse_shape(Center, 24.0, 24.0, fill_style(White))));
	ic.add_shape(const_shape_ptr(new line_shape(point(18.0, 50.0), point(82.0, 50.0), stroke_style(Gold, 3.0))));
}

void draw_serene_spirit(icon& ic, const graphics::color& c)
{
	const shape_style style = fill_style(White);
	ic.add_shape(const_shape_ptr(new rect_shape(44.0, 26.0, 12.0, 48.0, style)));
	ic.add_shape(const_shape_ptr(new rect_shape(26.0, 44.0, 48.0, 12.0, style)));
}

void draw_multitudation_vortex(icon& ic, const graphics::color& c)
{
	const shape_style style = stroke_style(White, 3.0);
	for(int i = 0; i != 4; ++i) {
		ic.add_shape(arc(Radius*(0.7 - i*0.1), i*Pi/2.0, (i + 2)*Pi/2.0, style));
	}

	const shape_style dot_style = fill_style(graphics::color(220, 220, 255));
	for(int i = 0; i != 3; ++i) {
		const double angle = 2.0*Pi*i/3.0 + Pi/6.0;
		const double dist = Radius*0.6;
		const point p(static_cast<int>(Center.x + dist*std::cos(angle)),
		              static_cast<int>(Center.y + dist*std::sin(angle)));
		ic.add_shape(circle(p, 6.0, dot_style));
	}
}

typedef void (*draw_fn)(icon&, const graphics::color&);

struct icon_definition {
	const char* id;
	int r, g, b;
	draw_fn draw;
};

const icon_definition Definitions[] = {
	{ "stone", 128, 128, 128, draw_stone },
	{ "iron", 176, 196, 222, draw_iron },
	{ "copper", 184, 115, 51, draw_copper },
	{ "thorium", 75, 0, 130, draw_thorium },
	{ "monster-coin", 212, 175, 55, draw_monster_coin },
	{ "force-core", 255, 0, 0, draw_force_core },
	{ "spirit-core", 0, 206, 209, draw_spirit_core },
	{ "magic-core", 138, 43, 226, draw_magic_core },
	{ "void-core", 25, 25, 25, draw_void_core },
	{ "unstoppable-force", 255, 69, 0, draw_unstoppable_force },
	{ "serene-spirit", 50, 205, 50, draw_serene_spirit },
	{ "multitudation-vortex", 150, 100, 255, draw_multitudation_vortex },
};

const int NumDefinitions = sizeof(Definitions)/sizeof(*Definitions);

const graphics::color DefaultColor(255, 0, 255);

const icon_definition* find_definition(const std::string& id)
{
	foreach(const icon_definition& def, Definitions) {
		if(id == def.id) {
			return &def;
		}
	}

	return NULL;
}

//every icon is drawn on a disc of its color with a darker rim.
icon_ptr create_disc_icon(const std::string& id, const graphics::color& c)
{
	icon_ptr res(new icon(id, view_box(0.0, 0.0, CanvasSize, CanvasSize), CanvasSize, CanvasSize));

	shape_style style = fill_style(c);
	style.stroke = graphics::paint(c.darken(40));
	style.stroke_width = 2.0;
	res->add_shape(circle(Center, Radius, style));
	return res;
}
}

const std::vector<std::string>& ids()
{
	static std::vector<std::string> res;
	if(res.empty()) {
		foreach(const icon_definition& def, Definitions) {
			res.push_back(def.id);
		}
	}

	return res;
}

bool is_builtin(const std::string& id)
{
	return find_definition(id) != NULL;
}

graphics::color icon_color(const std::string& id)
{
	const icon_definition* def = find_definition(id);
	if(def == NULL) {
		return DefaultColor;
	}

	return graphics::color(def->r, def->g, def->b);
}

const_icon_ptr create(const std::string& id)
{
	const icon_definition* def = find_definition(id);
	if(def == NULL) {
		return const_icon_ptr();
	}

	const graphics::color c(def->r, def->g, def->b);
	icon_ptr res = create_disc_icon(id, c);
	def->draw(*res, c);
	res->validate();
	return res;
}

const_icon_ptr default_icon(const std::string& id)
{
	ASSERT_LOG(!id.empty(), "DEFAULT ICON NEEDS AN ID");
	icon_ptr res = create_disc_icon(id, DefaultColor);

	text_shape* question_mark = new text_shape(Center, "?", CanvasSize/2.0, fill_style(White));
	question_mark->set_anchor("middle");
	question_mark->set_baseline("central");
	res->add_shape(const_shape_ptr(question_mark));

	res->validate();
	return res;
}

void add_to(icon_catalog& catalog)
{
	for(int n = 0; n != NumDefinitions; ++n) {
		catalog.add(create(Definitions[n].id));
	}
}

namespace {
icon_catalog create_catalog()
{
	icon_catalog res;
	add_to(res);
	return res;
}
}

const icon_catalog& catalog()
{
	static const icon_catalog res = create_catalog();
	return res;
}

}
