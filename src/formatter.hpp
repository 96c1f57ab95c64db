#ifndef FORMATTER_HPP_INCLUDED
#define FORMATTER_HPP_INCLUDED

#include <sstream>
#include <string>

class formatter
{
public:
	template<typename T>
	formatter& operator<<(const T& o) {
		stream_ << o;
		return *this;
	}

	const std::string str() const {
		return stream_.str();
	}

	const char* c_str() const {
		str_ = stream_.str();
		return str_.c_str();
	}

	operator std::string() const {
		return stream_.str();
	}
private:
	std::ostringstream stream_;
	mutable std::string str_;
};

#endif
