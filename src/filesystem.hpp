#ifndef FILESYSTEM_HPP_INCLUDED
#define FILESYSTEM_HPP_INCLUDED

#include <string>
#include <vector>

namespace sys
{

bool file_exists(const std::string& fname);
bool is_directory(const std::string& path);

std::string read_file(const std::string& fname);
void write_file(const std::string& fname, const std::string& data);

//creates the directory and any missing parents.
void create_directory(const std::string& path);

//full paths of the regular files in dir whose name ends in the given
//extension, sorted.
std::vector<std::string> get_files_in_dir(const std::string& dir, const std::string& extension);

//file name without directory and extension: "data/stone.svg" -> "stone".
std::string file_stem(const std::string& fname);

std::string join_path(const std::string& dir, const std::string& fname);

}

#endif
