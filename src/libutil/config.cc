#include "seqrt/util/config.hh"
#include "seqrt/util/util.hh"

#include <nlohmann/json.hpp>

namespace seqrt {

void Config::addSetting(AbstractSetting * setting)
{
    _settings.emplace(setting->name, Config::SettingData{false, setting});
}

bool Config::set(const std::string & name, const std::string & value)
{
    auto i = _settings.find(name);
    if (i == _settings.end())
        return false;
    i->second.setting->set(value);
    i->second.setting->overridden = true;
    return true;
}

void Config::applyEnvironment(const std::string & prefix)
{
    for (auto & [name, data] : _settings) {
        if (data.isAlias)
            continue;
        auto var = prefix + "_" + toUpper(replaceStrings(name, "-", "_"));
        if (auto value = getEnv(var)) {
            try {
                data.setting->set(*value);
                data.setting->overridden = true;
            } catch (UsageError & e) {
                e.addTrace("while reading environment variable '%s'", var);
                throw;
            }
        }
    }
}

void Config::resetOverridden()
{
    for (auto & s : _settings)
        s.second.setting->overridden = false;
}

nlohmann::json Config::toJSON()
{
    auto res = nlohmann::json::object();
    for (auto & s : _settings)
        if (!s.second.isAlias)
            res.emplace(s.first, s.second.setting->toJSON());
    return res;
}

AbstractSetting::AbstractSetting(const std::string & name, const std::string & description)
    : name(name)
    , description(description)
{
}

nlohmann::json AbstractSetting::toJSON()
{
    return nlohmann::json(to_string());
}

template<typename T>
nlohmann::json BaseSetting<T>::toJSON()
{
    return {{"value", value}, {"defaultValue", defaultValue}, {"description", description}};
}

template<>
std::string BaseSetting<std::string>::parse(const std::string & str) const
{
    return str;
}

template<>
std::string BaseSetting<std::string>::to_string() const
{
    return value;
}

template<typename T>
T BaseSetting<T>::parse(const std::string & str) const
{
    static_assert(std::is_integral<T>::value, "Integer required.");

    if (auto n = string2Int<T>(str))
        return *n;
    else
        throw UsageError("setting '%s' has invalid value '%s'", name, str);
}

template<typename T>
std::string BaseSetting<T>::to_string() const
{
    static_assert(std::is_integral<T>::value, "Integer required.");

    return std::to_string(value);
}

template<>
bool BaseSetting<bool>::parse(const std::string & str) const
{
    if (str == "true" || str == "yes" || str == "1")
        return true;
    else if (str == "false" || str == "no" || str == "0")
        return false;
    else
        throw UsageError("Boolean setting '%s' has invalid value '%s'", name, str);
}

template<>
std::string BaseSetting<bool>::to_string() const
{
    return value ? "true" : "false";
}

template class BaseSetting<int>;
template class BaseSetting<unsigned int>;
template class BaseSetting<long>;
template class BaseSetting<unsigned long>;
template class BaseSetting<long long>;
template class BaseSetting<unsigned long long>;
template class BaseSetting<bool>;
template class BaseSetting<std::string>;

} // namespace seqrt
