#ifndef Tdu_Service_kwargs_hh
#define Tdu_Service_kwargs_hh

#include <map>
#include <string>

namespace Tdu {

std::string trim(const std::string& str); // Remove leading and trailing whitepace

// Splits "key=value, key=value" into the map; throws on an entry without '='
void get_kwargs(const std::string& kwargs_str, std::map<std::string,std::string>& kwargs);

};

#endif
