#include "Restore.hpp"
#include "ResolvConf.hpp"
#include "LastSelection.hpp"
#include "Core/Logger.hpp"

#include <sstream>
#include <stdexcept>

namespace
{
    std::string Join(const Profiles::Servers &servers)
    {
        std::ostringstream out;
        out << "[";
        for (std::size_t i = 0; i < servers.size(); ++i)
        {
            if (i) out << ", ";
            out << servers[i];
        }
        out << "]";
        return out.str();
    }
}

Restore::Restore(const Profiles &profiles,
                 const ResolvConf &resolv,
                 const LastSelection &last)
        : profiles_(profiles)
        , resolv_(resolv)
        , last_(last)
{
}

Restore::Result Restore::Run(const Params &p) const
{
    if (!p.requested.empty())
        return Select_(p.requested);
    return RestoreLast_(p.fallback);
}

Restore::Result Restore::Select_(const std::string &requested) const
{
    Result r;
    r.profile            = requested;
    r.servers            = Resolve_(requested);
    r.explicit_selection = true;

    Apply_(requested, r.servers);

    try
    {
        last_.Save(requested);
    }
    catch (const std::exception &e)
    {
        LOGD("restore") << "Saving last DNS failed: " << e.what();
        throw std::runtime_error(std::string("error saving last DNS: ") + e.what());
    }

    LOGI("restore") << "DNS set to " << Join(r.servers) << " for profile '" << requested << "'";
    return r;
}

Restore::Result Restore::RestoreLast_(const std::string &fallback) const
{
    Result r;
    std::optional<std::string> last = last_.Load();
    if (!last || last->empty())
    {
        LOGI("restore") << "No previous DNS set or file missing, defaulting to '" << fallback << "'";
        r.profile = fallback;
    }
    else
    {
        r.profile = *last;
    }

    // сохранённое имя могло устареть после правки конфига: это фатально, без дальнейшего фолбэка
    r.servers = Resolve_(r.profile);
    Apply_(r.profile, r.servers);

    LOGI("restore") << "Restored last DNS: " << r.profile << " " << Join(r.servers);
    return r;
}

Profiles::Servers Restore::Resolve_(const std::string &name) const
{
    std::optional<Profiles::Servers> servers = profiles_.Lookup(name);
    if (!servers)
    {
        throw std::runtime_error("DNS entry for '" + name + "' not found in config");
    }
    return *servers;
}

void Restore::Apply_(const std::string &name, const Profiles::Servers &servers) const
{
    try
    {
        resolv_.Apply(servers);
    }
    catch (const std::exception &e)
    {
        LOGD("restore") << "Setting DNS '" << name << "' failed: " << e.what();
        throw std::runtime_error("error setting DNS '" + name + "': " + e.what());
    }
}
