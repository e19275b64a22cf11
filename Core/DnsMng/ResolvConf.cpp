#include "ResolvConf.hpp"
#include "Core/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

ResolvConf::ResolvConf(const Params &p)
        : p_(p)
{
    if (p_.path.empty())
        throw std::invalid_argument("ResolvConf: path is empty");
}

std::string ResolvConf::Render(const std::vector<std::string> &servers)
{
    std::ostringstream out;
    for (const auto &ip : servers)
    {
        out << "nameserver " << ip << "\n";
    }
    return out.str();
}

void ResolvConf::Apply(const std::vector<std::string> &servers) const
{
    const std::string content = Render(servers);

    std::ofstream f(p_.path, std::ios::binary | std::ios::trunc);
    if (!f)
        throw std::runtime_error("open " + p_.path + " failed: " + std::strerror(errno));

    f << content;
    f.close();
    if (f.fail())
        throw std::runtime_error("write " + p_.path + " failed: " + std::strerror(errno));

    LOGD("resolv") << "Wrote " << servers.size() << " nameserver(s) to " << p_.path;
}
