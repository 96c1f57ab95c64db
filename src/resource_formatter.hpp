#ifndef RESOURCE_FORMATTER_HPP_INCLUDED
#define RESOURCE_FORMATTER_HPP_INCLUDED

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace resource {

typedef std::map<std::string, int> amount_map;
typedef std::vector<std::pair<std::string, int> > amount_list;

//resources in display order, then those not in the display order by
//name.
amount_list sort_resources(const amount_map& amounts);

//"Monster Coins: 2, Stone: 40"; "Free" when nothing is needed.
std::string format_cost(const amount_map& cost, const std::string& separator=", ");

//reads "Stone=40,Monster Coins=2".
amount_map parse_cost(const std::string& str);

}

#endif
