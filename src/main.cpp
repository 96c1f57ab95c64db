#include <iostream>
#include <string>
#include <vector>

#include "tool.hpp"

int main(int argc, char** argv)
{
	const std::vector<std::string> args(argv + 1, argv + argc);
	return tool::run(args, std::cout, std::cerr);
}
