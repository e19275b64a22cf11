#include "Profiles.hpp"
#include "Core/Config.hpp"
#include "Core/Logger.hpp"

#include <stdexcept>

Profiles Profiles::Load(const std::string &path)
{
    LOGD("config") << "Loading profiles from " << path;
    return Parse(Config::ReadFile(path), path);
}

Profiles Profiles::Parse(const std::string &text, const std::string &origin)
{
    boost::json::value jv = Config::Parse(text, origin);
    if (!jv.is_object())
        throw std::runtime_error(origin + ": config root must be an object");

    Profiles out;
    try
    {
        const boost::json::object &dns = Config::RequireObject(jv.as_object(), "dns");
        for (const auto &kv : dns)
        {
            const std::string name(kv.key().data(), kv.key().size());
            out.map_.emplace(name, Config::RequireStringArray(kv.value(), "dns." + name));
        }
    }
    catch (const std::runtime_error &e)
    {
        throw std::runtime_error(origin + ": " + e.what());
    }

    LOGD("config") << "Loaded " << out.map_.size() << " profile(s) from " << origin;
    return out;
}

std::optional<Profiles::Servers> Profiles::Lookup(const std::string &name) const
{
    auto it = map_.find(name);
    if (it == map_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> Profiles::Names() const
{
    std::vector<std::string> names;
    names.reserve(map_.size());
    for (const auto &kv : map_) names.push_back(kv.first);
    return names;
}
