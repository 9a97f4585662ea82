#include "tdu/service/kwargs.hh"

#include "tdu/service/SysLog.hh"

#include <sstream>
#include <stdexcept>

using logging = Tdu::SysLog;

static const char* whitespace = " \t\n\r\f\v";

std::string Tdu::trim(const std::string& str)
{
    auto first = str.find_first_not_of(whitespace);
    if (first == std::string::npos)
        return std::string();
    auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last-first+1);
}

void Tdu::get_kwargs(const std::string& kwargs_str, std::map<std::string,std::string>& kwargs) {
    std::istringstream ss(kwargs_str);
    std::string kwarg;
    while (getline(ss, kwarg, ',')) {
        if (trim(kwarg).empty())
            continue;
        auto pos = kwarg.find("=", 0);
        if (pos == std::string::npos) {
            logging::critical("Keyword argument with no equal sign");
            throw std::runtime_error("Keyword argument with no equal sign: "+kwargs_str);
        }
        std::string key = trim(kwarg.substr(0,pos));
        std::string value = trim(kwarg.substr(pos+1,kwarg.length()));
        kwargs[key] = value;
    }
}
