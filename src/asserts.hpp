#ifndef ASSERTS_HPP_INCLUDED
#define ASSERTS_HPP_INCLUDED

#include <sstream>
#include <string>

//thrown whenever a definition or an argument fails one of the checks
//below. Carries the location and the message.
struct validation_failure_exception {
	explicit validation_failure_exception(const std::string& m);
	std::string msg;
};

[[noreturn]] void report_assert_failure(const char* file, int line, const std::string& message);

#define ASSERT_LOG(a,b) if(!(a)) { std::ostringstream s__; s__ << b; report_assert_failure(__FILE__, __LINE__, s__.str()); }

//for the end of a function that has handled every valid case.
#define ASSERT_FAILED(b) { std::ostringstream s__; s__ << b; report_assert_failure(__FILE__, __LINE__, s__.str()); }

#define ASSERT_EQ(a,b) ASSERT_LOG((a) == (b), "ASSERT EQ FAILED: " #a " == " #b ": " << (a) << " != " << (b))
#define ASSERT_NE(a,b) ASSERT_LOG((a) != (b), "ASSERT NE FAILED: " #a " != " #b ": " << (a) << " == " << (b))
#define ASSERT_GE(a,b) ASSERT_LOG((a) >= (b), "ASSERT GE FAILED: " #a " >= " #b ": " << (a) << " < " << (b))
#define ASSERT_GT(a,b) ASSERT_LOG((a) > (b), "ASSERT GT FAILED: " #a " > " #b ": " << (a) << " <= " << (b))

#endif
