#include <ostream>
#include <string>
#include <vector>

#include "asserts.hpp"
#include "builtin_icons.hpp"
#include "filesystem.hpp"
#include "foreach.hpp"
#include "icon.hpp"
#include "icon_cache.hpp"
#include "icon_catalog.hpp"
#include "preferences.hpp"
#include "resource.hpp"
#include "resource_formatter.hpp"
#include "tool.hpp"
#include "xml_writer.hpp"

namespace tool {

void print_usage(std::ostream& s)
{
	s << "usage: castle-icons [--config FILE] [--icons PATH]... [--no-builtin] [--size WxH]\n"
	     "                    [--default-size=WxH] [--verbose] COMMAND\n"
	     "  --list               print icon identifiers\n"
	     "  --show ID            print one icon as SVG\n"
	     "  --export DIR         write DIR/<id>.svg for every icon\n"
	     "  --sprite FILE        write every icon into one sprite sheet\n"
	     "  --check FILE         load FILE and report its icons\n"
	     "  --resource NAME      print the icon identifier of a resource\n"
	     "  --cost COST          format a cost given as Name=amount,...\n";
}

namespace {

bool takes_argument(const std::string& command)
{
	return command == "--show" || command == "--export" || command == "--sprite" ||
	       command == "--check" || command == "--resource" || command == "--cost";
}

void load_catalog(icon_catalog& catalog)
{
	if(preferences::use_builtin_icons()) {
		builtin_icons::add_to(catalog);
	}

	foreach(const std::string& path, preferences::icon_paths()) {
		catalog.load_path(path);
	}
}

//the icon as declared, or fitted to the requested size.
const_icon_ptr sized_icon(const icon_catalog& catalog, icon_cache& cache, const std::string& id, int width, int height)
{
	if(width > 0) {
		return cache.get(id, width, height);
	}

	return catalog.get(id);
}

int check_file(const std::string& fname, std::ostream& out, std::ostream& err)
{
	icon_catalog catalog;
	catalog.load_path(fname);
	foreach(const std::string& id, catalog.all()) {
		const_icon_ptr ic = catalog.get(id);
		out << id << ": " << ic->shapes().size() << " shapes, canvas "
		    << ic->canvas().w << "x" << ic->canvas().h << ", size "
		    << ic->width() << "x" << ic->height() << "\n";
		if(!ic->content_inside_canvas()) {
			err << "WARNING: CONTENT OF ICON '" << id << "' EXTENDS BEYOND ITS CANVAS: "
			    << ic->content_bounds() << "\n";
		}
	}

	return 0;
}

int run_command(const std::string& command, const std::string& arg, int width, int height,
                std::ostream& out, std::ostream& err)
{
	if(command == "--resource") {
		out << resource::resource_icon(arg) << "\n";
		return 0;
	} else if(command == "--cost") {
		out << resource::format_cost(resource::parse_cost(arg)) << "\n";
		return 0;
	} else if(command == "--check") {
		return check_file(arg, out, err);
	}

	icon_catalog catalog;
	load_catalog(catalog);
	icon_cache cache(catalog);

	if(command == "--list") {
		foreach(const std::string& id, catalog.all()) {
			out << id << "\n";
		}
	} else if(command == "--show") {
		ASSERT_LOG(catalog.has(arg), "UNKNOWN ICON: " << arg);
		out << sized_icon(catalog, cache, arg, width, height)->to_svg();
	} else if(command == "--export") {
		sys::create_directory(arg);
		foreach(const std::string& id, catalog.all()) {
			const std::string fname = sys::join_path(arg, id + ".svg");
			sys::write_file(fname, sized_icon(catalog, cache, id, width, height)->to_svg());
			if(preferences::verbose()) {
				err << "WROTE " << fname << "\n";
			}
		}
	} else if(command == "--sprite") {
		sys::write_file(arg, xml::output_xml(catalog.write_sprite_sheet()));
	}

	return 0;
}

}

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err)
{
	std::string command, command_arg;
	int width = 0, height = 0;

	try {
		//the config file comes first so the rest of the command line can
		//override it.
		for(int n = 0; n < args.size(); ++n) {
			if(args[n] == "--config" && n+1 != args.size()) {
				++n;
				preferences::load_preferences(args[n]);
			}
		}

		for(int n = 0; n < args.size(); ++n) {
			const std::string& arg = args[n];
			if(arg == "--config" && n+1 != args.size()) {
				++n;
			} else if(arg == "--icons" && n+1 != args.size()) {
				++n;
				preferences::add_icon_path(args[n]);
			} else if(preferences::parse_arg(arg)) {
			} else if(arg == "--size" && n+1 != args.size()) {
				++n;
				preferences::parse_size(args[n], &width, &height);
			} else if(arg == "--help" || arg == "-h") {
				print_usage(out);
				return 0;
			} else if(arg == "--list" || (takes_argument(arg) && n+1 != args.size())) {
				if(!command.empty()) {
					err << "ONLY ONE COMMAND MAY BE GIVEN: " << command << ", " << arg << "\n";
					return 2;
				}

				command = arg;
				if(takes_argument(arg)) {
					++n;
					command_arg = args[n];
				}
			} else {
				err << "UNRECOGNIZED ARGUMENT: " << arg << "\n";
				print_usage(err);
				return 2;
			}
		}

		if(command.empty()) {
			print_usage(err);
			return 2;
		}

		return run_command(command, command_arg, width, height, out, err);
	} catch(validation_failure_exception& e) {
		err << e.msg << "\n";
		return 1;
	}
}

}
