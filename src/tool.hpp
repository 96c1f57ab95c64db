#ifndef TOOL_HPP_INCLUDED
#define TOOL_HPP_INCLUDED

#include <iosfwd>
#include <string>
#include <vector>

namespace tool {

void print_usage(std::ostream& s);

//runs the castle-icons command line (without the program name). Results
//go to out, diagnostics to err. Returns the exit status: 0 on success,
//1 if the command failed and 2 for a usage error.
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

}

#endif
