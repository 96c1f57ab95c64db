#ifndef TEST_HELPERS_HPP_INCLUDED
#define TEST_HELPERS_HPP_INCLUDED

#include "asserts.hpp"

//the library's assertion macros share their names with GoogleTest's.
#undef ASSERT_EQ
#undef ASSERT_NE
#undef ASSERT_GE
#undef ASSERT_GT

#include <gtest/gtest.h>

#include <string>

#include <boost/filesystem.hpp>

//a fresh directory under the system temp directory, removed with
//everything in it on destruction.
class TempDir
{
public:
	TempDir() : path_(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("castle-icons-%%%%-%%%%"))
	{
		boost::filesystem::create_directories(path_);
	}

	~TempDir()
	{
		boost::system::error_code ec;
		boost::filesystem::remove_all(path_, ec);
	}

	std::string file(const std::string& name) const { return (path_ / name).string(); }
	std::string str() const { return path_.string(); }

private:
	boost::filesystem::path path_;
};

#endif
