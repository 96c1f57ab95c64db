#include "asserts.hpp"

validation_failure_exception::validation_failure_exception(const std::string& m)
  : msg(m)
{}

void report_assert_failure(const char* file, int line, const std::string& message)
{
	std::ostringstream s;
	s << file << ":" << line << " ASSERTION FAILED: " << message;
	throw validation_failure_exception(s.str());
}
