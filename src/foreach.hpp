#ifndef FOREACH_HPP_INCLUDED
#define FOREACH_HPP_INCLUDED

#include <boost/foreach.hpp>

#define foreach BOOST_FOREACH

#endif
