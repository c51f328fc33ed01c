#include "seqrt/util/util.hh"

#include <cctype>
#include <cstdlib>

namespace seqrt {

std::optional<std::string> getEnv(const std::string & key)
{
    char * value = std::getenv(key.c_str());
    if (!value)
        return {};
    return std::string(value);
}

std::string toUpper(std::string s)
{
    for (auto & c : s)
        c = std::toupper(static_cast<unsigned char>(c));
    return s;
}

std::string replaceStrings(std::string res, std::string_view from, std::string_view to)
{
    if (from.empty())
        return res;
    size_t pos = 0;
    while ((pos = res.find(from, pos)) != res.npos) {
        res.replace(pos, from.size(), to);
        pos += to.size();
    }
    return res;
}

} // namespace seqrt
