#ifndef PATH_DATA_HPP_INCLUDED
#define PATH_DATA_HPP_INCLUDED

#include <string>
#include <vector>

#include "geometry.hpp"

//the 'd' attribute of an SVG path, split into one command per segment.
//Implicit repeats are expanded ("M0 0 10 10" is M then L) and a leading
//relative moveto is made absolute.
class path_data
{
public:
	struct command {
		command() : op('M') {}
		char op;
		std::vector<double> args;
	};

	//number of arguments a command letter takes, or -1 for a letter that
	//is not a path command.
	static int num_args(char op);

	path_data();
	explicit path_data(const std::string& d);

	void add_command(char op, const std::vector<double>& args);

	const std::vector<command>& commands() const { return commands_; }
	bool empty() const { return commands_.empty(); }

	std::string to_string() const;

	path_data transformed(const scale_transform& t) const;

	//box of everything the path passes through; curves use their control
	//points, arcs are exact.
	bounds bounding_box() const;

private:
	std::vector<command> commands_;
};

bool operator==(const path_data& a, const path_data& b);
bool operator!=(const path_data& a, const path_data& b);

#endif
