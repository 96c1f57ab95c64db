#include "asserts.hpp"
#include "foreach.hpp"
#include "formatter.hpp"
#include "resource.hpp"
#include "resource_formatter.hpp"
#include "string_utils.hpp"

namespace resource {

amount_list sort_resources(const amount_map& amounts)
{
	amount_list res;
	for(int n = 0; n != num_resources(); ++n) {
		amount_map::const_iterator itor = amounts.find(resource_name(n));
		if(itor != amounts.end()) {
			res.push_back(*itor);
		}
	}

	for(amount_map::const_iterator i = amounts.begin(); i != amounts.end(); ++i) {
		if(resource_index(i->first) == -1) {
			res.push_back(*i);
		}
	}

	return res;
}

std::string format_cost(const amount_map& cost, const std::string& separator)
{
	if(cost.empty()) {
		return "Free";
	}

	std::string res;
	foreach(const amount_list::value_type& item, sort_resources(cost)) {
		if(!res.empty()) {
			res += separator;
		}

		res += formatter() << item.first << ": " << item.second;
	}

	return res;
}

amount_map parse_cost(const std::string& str)
{
	amount_map res;
	foreach(const std::string& item, util::split(str)) {
		const std::vector<std::string> kv = util::split(item, '=');
		ASSERT_LOG(kv.size() == 2, "ILLEGAL COST FORMAT: '" << str << "'");

		const double amount = util::parse_number(kv[1]);
		ASSERT_LOG(util::is_int_value(amount) && amount >= 0, "ILLEGAL AMOUNT FOR " << kv[0] << ": '" << kv[1] << "'");
		ASSERT_LOG(res.count(kv[0]) == 0, "RESOURCE REPEATED IN COST: " << kv[0]);
		res[kv[0]] = static_cast<int>(amount);
	}

	return res;
}

}
