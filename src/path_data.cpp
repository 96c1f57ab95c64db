#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

#include "asserts.hpp"
#include "foreach.hpp"
#include "path_data.hpp"
#include "string_utils.hpp"

namespace {
const double Pi = 3.14159265358979323846;

bool is_separator(char c)
{
	return c == ',' || c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

void skip_separators(const char*& p, const char* end)
{
	while(p != end && is_separator(*p)) {
		++p;
	}
}

bool is_digit(char c)
{
	return c >= '0' && c <= '9';
}

const char* skip_digits(const char* p, const char* end)
{
	while(p != end && is_digit(*p)) {
		++p;
	}

	return p;
}

//sign, digits, optional fraction and optional exponent; nothing else
//that strtod would take, such as hex or inf.
double read_number(const char*& p, const char* end, const std::string& d)
{
	const char* q = p;
	if(q != end && (*q == '-' || *q == '+')) {
		++q;
	}

	const char* mantissa = q;
	q = skip_digits(q, end);
	bool has_digits = q != mantissa;
	if(q != end && *q == '.') {
		const char* fraction = ++q;
		q = skip_digits(q, end);
		has_digits = has_digits || q != fraction;
	}

	ASSERT_LOG(has_digits, "EXPECTED NUMBER IN PATH DATA AT OFFSET " << (p - d.c_str()) << ": '" << d << "'");

	if(q != end && (*q == 'e' || *q == 'E')) {
		const char* exponent = q + 1;
		if(exponent != end && (*exponent == '-' || *exponent == '+')) {
			++exponent;
		}

		if(exponent != end && is_digit(*exponent)) {
			q = skip_digits(exponent, end);
		}
	}

	const std::string text(p, q);
	const double res = std::strtod(text.c_str(), NULL);
	ASSERT_LOG(std::isfinite(res), "ILLEGAL NUMBER IN PATH DATA: '" << d << "'");
	p = q;
	return res;
}

//radii and rotation in degrees of an arc's ellipse after the scale.
//Orientation is kept, so the flags do not change.
void scale_arc(double& rx, double& ry, double& rotation, const scale_transform& t)
{
	rx = std::fabs(rx);
	ry = std::fabs(ry);

	double quadrant = std::fmod(rotation, 180.0);
	if(quadrant < 0.0) {
		quadrant += 180.0;
	}

	if(t.sx == t.sy) {
		rx *= t.sx;
		ry *= t.sx;
		return;
	} else if(quadrant == 0.0) {
		rx *= t.sx;
		ry *= t.sy;
		return;
	} else if(quadrant == 90.0) {
		rx *= t.sy;
		ry *= t.sx;
		return;
	}

	//the ellipse is the image of the unit circle under m; its axes are
	//the singular vectors of m.
	const double angle = rotation*Pi/180.0;
	const double m00 = t.sx*rx*std::cos(angle), m01 = -t.sx*ry*std::sin(angle);
	const double m10 = t.sy*rx*std::sin(angle), m11 = t.sy*ry*std::cos(angle);

	const double a = m00*m00 + m01*m01;
	const double b = m00*m10 + m01*m11;
	const double c = m10*m10 + m11*m11;
	const double mid = (a + c)/2.0;
	const double diff = std::sqrt((a - c)*(a - c)/4.0 + b*b);

	rx = std::sqrt(mid + diff);
	ry = std::sqrt(std::max(0.0, mid - diff));
	rotation = std::atan2(2.0*b, a - c)/2.0*180.0/Pi;
}

point arg_point(const path_data::command& cmd, int index, const point& base)
{
	return point(base.x + cmd.args[index], base.y + cmd.args[index+1]);
}

bool angle_in_sweep(double angle, double start, double sweep)
{
	double d = sweep >= 0.0 ? angle - start : start - angle;
	d = std::fmod(d, 2.0*Pi);
	if(d < 0.0) {
		d += 2.0*Pi;
	}

	return d <= std::fabs(sweep);
}

//the end point is added by the caller. Follows the endpoint to centre
//conversion of the SVG implementation notes.
void add_arc_bounds(bounds& res, const point& p0, double rx, double ry, double rotation,
                    bool large_arc, bool sweep, const point& p1)
{
	rx = std::fabs(rx);
	ry = std::fabs(ry);
	if(p0 == p1 || rx == 0.0 || ry == 0.0) {
		return;
	}

	const double phi = rotation*Pi/180.0;
	const double cosp = std::cos(phi);
	const double sinp = std::sin(phi);

	const double dx2 = (p0.x - p1.x)/2.0;
	const double dy2 = (p0.y - p1.y)/2.0;
	const double x1p = cosp*dx2 + sinp*dy2;
	const double y1p = -sinp*dx2 + cosp*dy2;

	const double lambda = (x1p*x1p)/(rx*rx) + (y1p*y1p)/(ry*ry);
	if(lambda > 1.0) {
		rx *= std::sqrt(lambda);
		ry *= std::sqrt(lambda);
	}

	const double num = rx*rx*ry*ry - rx*rx*y1p*y1p - ry*ry*x1p*x1p;
	const double den = rx*rx*y1p*y1p + ry*ry*x1p*x1p;
	double coef = num <= 0.0 ? 0.0 : std::sqrt(num/den);
	if(large_arc == sweep) {
		coef = -coef;
	}

	const double cxp = coef*rx*y1p/ry;
	const double cyp = -coef*ry*x1p/rx;
	const double cx = cosp*cxp - sinp*cyp + (p0.x + p1.x)/2.0;
	const double cy = sinp*cxp + cosp*cyp + (p0.y + p1.y)/2.0;

	const double theta1 = std::atan2((y1p - cyp)/ry, (x1p - cxp)/rx);
	const double theta2 = std::atan2((-y1p - cyp)/ry, (-x1p - cxp)/rx);
	double dtheta = theta2 - theta1;
	if(sweep && dtheta < 0.0) {
		dtheta += 2.0*Pi;
	} else if(!sweep && dtheta > 0.0) {
		dtheta -= 2.0*Pi;
	}

	const double tx = std::atan2(-ry*sinp, rx*cosp);
	const double ty = std::atan2(ry*cosp, rx*sinp);
	const double candidates[] = { tx, tx + Pi, ty, ty + Pi };
	foreach(double t, candidates) {
		if(angle_in_sweep(t, theta1, dtheta)) {
			res.add(point(cx + rx*cosp*std::cos(t) - ry*sinp*std::sin(t),
			              cy + rx*sinp*std::cos(t) + ry*cosp*std::sin(t)));
		}
	}
}
}

int path_data::num_args(char op)
{
	switch(std::toupper(op)) {
	case 'M': case 'L': case 'T': return 2;
	case 'H': case 'V': return 1;
	case 'C': return 6;
	case 'S': case 'Q': return 4;
	case 'A': return 7;
	case 'Z': return 0;
	default: return -1;
	}
}

path_data::path_data()
{}

path_data::path_data(const std::string& d)
{
	const char* p = d.c_str();
	const char* end = p + d.size();
	char op = 0;
	for(;;) {
		skip_separators(p, end);
		if(p == end) {
			break;
		}

		if(std::isalpha(static_cast<unsigned char>(*p))) {
			op = *p++;
			ASSERT_LOG(num_args(op) >= 0, "ILLEGAL PATH COMMAND '" << op << "': '" << d << "'");
			if(num_args(op) == 0) {
				add_command(op, std::vector<double>());
				op = 0;
				continue;
			}
		} else {
			ASSERT_LOG(op != 0, "UNEXPECTED NUMBER IN PATH DATA: '" << d << "'");
		}

		std::vector<double> args;
		for(int n = 0; n != num_args(op); ++n) {
			skip_separators(p, end);
			ASSERT_LOG(p != end, "PATH DATA ENDS INSIDE A COMMAND: '" << d << "'");
			if(std::toupper(op) == 'A' && (n == 3 || n == 4)) {
				ASSERT_LOG(*p == '0' || *p == '1', "ILLEGAL ARC FLAG IN PATH DATA: '" << d << "'");
				args.push_back(*p - '0');
				++p;
			} else {
				args.push_back(read_number(p, end, d));
			}
		}

		add_command(op, args);

		if(op == 'M') {
			op = 'L';
		} else if(op == 'm') {
			op = 'l';
		}
	}

	if(!commands_.empty() && commands_.front().op == 'm') {
		commands_.front().op = 'M';
	}
}

void path_data::add_command(char op, const std::vector<double>& args)
{
	ASSERT_LOG(num_args(op) >= 0, "ILLEGAL PATH COMMAND '" << op << "'");
	ASSERT_EQ(args.size(), static_cast<size_t>(num_args(op)));
	ASSERT_LOG(!commands_.empty() || std::toupper(op) == 'M', "PATH DATA MUST START WITH A MOVETO, NOT '" << op << "'");

	command cmd;
	cmd.op = op;
	cmd.args = args;
	commands_.push_back(cmd);
}

std::string path_data::to_string() const
{
	std::string res;
	foreach(const command& cmd, commands_) {
		if(!res.empty()) {
			res += " ";
		}

		res += cmd.op;
		for(int n = 0; n != cmd.args.size(); ++n) {
			if(n != 0) {
				res += " ";
			}
			res += util::format_number(cmd.args[n]);
		}
	}

	return res;
}

path_data path_data::transformed(const scale_transform& t) const
{
	ASSERT_LOG(t.sx > 0.0 && t.sy > 0.0, "PATH TRANSFORMS MUST KEEP ORIENTATION");

	path_data res(*this);
	foreach(command& cmd, res.commands_) {
		const bool relative = std::islower(cmd.op) != 0;
		std::vector<double>& a = cmd.args;
		switch(std::toupper(cmd.op)) {
		case 'H':
			a[0] = relative ? a[0]*t.sx : t.apply_x(a[0]);
			break;
		case 'V':
			a[0] = relative ? a[0]*t.sy : t.apply_y(a[0]);
			break;
		case 'A':
			scale_arc(a[0], a[1], a[2], t);
			a[5] = relative ? a[5]*t.sx : t.apply_x(a[5]);
			a[6] = relative ? a[6]*t.sy : t.apply_y(a[6]);
			break;
		default:
			for(int n = 0; n+1 < a.size(); n += 2) {
				a[n] = relative ? a[n]*t.sx : t.apply_x(a[n]);
				a[n+1] = relative ? a[n+1]*t.sy : t.apply_y(a[n+1]);
			}
			break;
		}
	}

	return res;
}

bounds path_data::bounding_box() const
{
	bounds res;
	point cur, start, cubic_ctrl, quad_ctrl;
	char prev = 0;
	foreach(const command& cmd, commands_) {
		const char op = std::toupper(cmd.op);
		const point base = std::islower(cmd.op) ? cur : point();
		switch(op) {
		case 'M':
			cur = start = arg_point(cmd, 0, base);
			break;
		case 'L':
			cur = arg_point(cmd, 0, base);
			break;
		case 'H':
			cur.x = base.x + cmd.args[0];
			break;
		case 'V':
			cur.y = base.y + cmd.args[0];
			break;
		case 'C':
			res.add(arg_point(cmd, 0, base));
			cubic_ctrl = arg_point(cmd, 2, base);
			res.add(cubic_ctrl);
			cur = arg_point(cmd, 4, base);
			break;
		case 'S': {
			const point reflected = (prev == 'C' || prev == 'S') ?
			    point(2.0*cur.x - cubic_ctrl.x, 2.0*cur.y - cubic_ctrl.y) : cur;
			res.add(reflected);
			cubic_ctrl = arg_point(cmd, 0, base);
			res.add(cubic_ctrl);
			cur = arg_point(cmd, 2, base);
			break;
		}
		case 'Q':
			quad_ctrl = arg_point(cmd, 0, base);
			res.add(quad_ctrl);
			cur = arg_point(cmd, 2, base);
			break;
		case 'T':
			quad_ctrl = (prev == 'Q' || prev == 'T') ?
			    point(2.0*cur.x - quad_ctrl.x, 2.0*cur.y - quad_ctrl.y) : cur;
			res.add(quad_ctrl);
			cur = arg_point(cmd, 0, base);
			break;
		case 'A': {
			const point end = arg_point(cmd, 5, base);
			add_arc_bounds(res, cur, cmd.args[0], cmd.args[1], cmd.args[2],
			               cmd.args[3] != 0.0, cmd.args[4] != 0.0, end);
			cur = end;
			break;
		}
		case 'Z':
			cur = start;
			break;
		}

		res.add(cur);
		prev = op;
	}

	return res;
}

bool operator==(const path_data& a, const path_data& b)
{
	if(a.commands().size() != b.commands().size()) {
		return false;
	}

	for(int n = 0; n != a.commands().size(); ++n) {
		if(a.commands()[n].op != b.commands()[n].op || a.commands()[n].args != b.commands()[n].args) {
			return false;
		}
	}

	return true;
}

bool operator!=(const path_data& a, const path_data& b)
{
	return !(a == b);
}
