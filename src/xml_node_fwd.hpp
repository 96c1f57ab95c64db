#ifndef XML_NODE_FWD_HPP_INCLUDED
#define XML_NODE_FWD_HPP_INCLUDED

#include <boost/shared_ptr.hpp>

namespace xml
{

class node;
typedef boost::shared_ptr<node> node_ptr;
typedef boost::shared_ptr<const node> const_node_ptr;

}

#endif
