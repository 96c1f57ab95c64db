#include <algorithm>
#include <fstream>
#include <iterator>

#include <boost/filesystem.hpp>

#include "asserts.hpp"
#include "filesystem.hpp"

namespace sys
{

namespace fs = boost::filesystem;

bool file_exists(const std::string& fname)
{
	boost::system::error_code ec;
	return fs::is_regular_file(fname, ec);
}

bool is_directory(const std::string& path)
{
	boost::system::error_code ec;
	return fs::is_directory(path, ec);
}

std::string read_file(const std::string& fname)
{
	std::ifstream file(fname.c_str(), std::ios_base::binary);
	ASSERT_LOG(file, "COULD NOT READ FILE: " << fname);
	return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void write_file(const std::string& fname, const std::string& data)
{
	std::ofstream file(fname.c_str(), std::ios_base::binary);
	ASSERT_LOG(file, "COULD NOT OPEN FILE FOR WRITING: " << fname);
	file << data;
	file.close();
	ASSERT_LOG(!file.fail(), "ERROR WRITING FILE: " << fname);
}

void create_directory(const std::string& path)
{
	boost::system::error_code ec;
	fs::create_directories(path, ec);
	ASSERT_LOG(!ec && fs::is_directory(path), "COULD NOT CREATE DIRECTORY: " << path << ": " << ec.message());
}

std::vector<std::string> get_files_in_dir(const std::string& dir, const std::string& extension)
{
	std::vector<std::string> res;
	boost::system::error_code ec;
	fs::directory_iterator i(dir, ec);
	ASSERT_LOG(!ec, "COULD NOT LIST DIRECTORY: " << dir << ": " << ec.message());
	for(; i != fs::directory_iterator(); i.increment(ec)) {
		ASSERT_LOG(!ec, "COULD NOT LIST DIRECTORY: " << dir << ": " << ec.message());
		if(fs::is_regular_file(i->status()) && i->path().extension().string() == extension) {
			res.push_back(i->path().string());
		}
	}

	std::sort(res.begin(), res.end());
	return res;
}

std::string file_stem(const std::string& fname)
{
	return fs::path(fname).stem().string();
}

std::string join_path(const std::string& dir, const std::string& fname)
{
	return (fs::path(dir) / fname).string();
}

}
