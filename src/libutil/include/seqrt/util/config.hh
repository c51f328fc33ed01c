#pragma once
///@file

#include "seqrt/util/error.hh"

#include <map>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace seqrt {

class AbstractSetting;

/**
 * A set of named settings. Settings register themselves with the
 * `Config` they are declared in, so a `Config` subclass is just a list
 * of `Setting<T>` members:
 *
 * ```
 * struct MyConfig : Config
 * {
 *     Setting<bool> foo{this, false, "foo", "the foo setting"};
 * };
 * ```
 */
class Config
{
    friend class AbstractSetting;

public:

    struct SettingData
    {
        bool isAlias;
        AbstractSetting * setting;
    };

    using Settings = std::map<std::string, SettingData>;

private:

    Settings _settings;

public:

    virtual ~Config() = default;

    /**
     * Set a setting by name. Returns false if the name is unknown,
     * throws `UsageError` if the value cannot be parsed.
     */
    bool set(const std::string & name, const std::string & value);

    /**
     * Override every setting for which an environment variable named
     * `<prefix>_<NAME>` exists. Dashes in setting names become
     * underscores.
     */
    void applyEnvironment(const std::string & prefix);

    void addSetting(AbstractSetting * setting);

    /**
     * Reset the "overridden" flag of all settings.
     */
    void resetOverridden();

    nlohmann::json toJSON();
};

class AbstractSetting
{
    friend class Config;

public:

    const std::string name;
    const std::string description;

    bool overridden = false;

protected:

    AbstractSetting(const std::string & name, const std::string & description);

    virtual ~AbstractSetting() = default;

    virtual void set(const std::string & value) = 0;

    virtual std::string to_string() const = 0;

    virtual nlohmann::json toJSON();
};

/**
 * A setting of type T.
 */
template<typename T>
class BaseSetting : public AbstractSetting
{
protected:

    T value;
    const T defaultValue;

public:

    BaseSetting(const T & def, const std::string & name, const std::string & description)
        : AbstractSetting(name, description)
        , value(def)
        , defaultValue(def)
    {
    }

    operator const T &() const
    {
        return value;
    }

    operator T &()
    {
        return value;
    }

    const T & get() const
    {
        return value;
    }

    bool operator==(const T & v2) const
    {
        return value == v2;
    }

    bool operator!=(const T & v2) const
    {
        return value != v2;
    }

    void operator=(const T & v)
    {
        assign(v);
    }

    virtual void assign(const T & v)
    {
        value = v;
    }

    const T & getDefault() const
    {
        return defaultValue;
    }

    /**
     * Parse the string into a `T`.
     *
     * Used by `set()`.
     */
    virtual T parse(const std::string & str) const;

    void set(const std::string & str) override
    {
        value = parse(str);
    }

    std::string to_string() const override;

    void override(const T & v)
    {
        overridden = true;
        value = v;
    }

    nlohmann::json toJSON() override;
};

template<typename T>
std::ostream & operator<<(std::ostream & str, const BaseSetting<T> & opt)
{
    return str << static_cast<const T &>(opt);
}

template<typename T>
class Setting : public BaseSetting<T>
{
public:
    Setting(Config * options, const T & def, const std::string & name, const std::string & description)
        : BaseSetting<T>(def, name, description)
    {
        options->addSetting(this);
    }

    void operator=(const T & v)
    {
        this->assign(v);
    }
};

} // namespace seqrt
