#include "Core/Config.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace
{
    const boost::json::value &Require_(const boost::json::object &o, const char *key)
    {
        const boost::json::value *v = o.if_contains(key);
        if (!v)
            throw std::runtime_error(std::string("missing required field '") + key + "'");
        return *v;
    }
}

namespace Config
{
    std::string ReadFile(const std::string &path)
    {
        std::ifstream f(path, std::ios::binary);
        if (!f)
            throw std::runtime_error("cannot open " + path + ": " + std::strerror(errno));

        std::ostringstream ss;
        ss << f.rdbuf();
        if (f.bad())
            throw std::runtime_error("cannot read " + path + ": " + std::strerror(errno));
        return ss.str();
    }

    boost::json::value Parse(const std::string &text, const std::string &origin)
    {
        boost::system::error_code ec;
        boost::json::value jv = boost::json::parse(text, ec);
        if (ec)
            throw std::runtime_error(origin + ": invalid JSON: " + ec.message());
        return jv;
    }

    const boost::json::object &RequireObject(const boost::json::object &o, const char *key)
    {
        const boost::json::value &v = Require_(o, key);
        if (!v.is_object())
            throw std::runtime_error(std::string("field '") + key + "' must be an object");
        return v.as_object();
    }

    std::vector<std::string> RequireStringArray(const boost::json::value &v, const std::string &what)
    {
        if (!v.is_array())
            throw std::runtime_error("'" + what + "' must be an array of strings");

        std::vector<std::string> out;
        out.reserve(v.as_array().size());
        for (const boost::json::value &x : v.as_array())
        {
            if (!x.is_string())
                throw std::runtime_error("'" + what + "' must contain only strings");
            out.emplace_back(boost::json::value_to<std::string>(x));
        }
        return out;
    }
}
