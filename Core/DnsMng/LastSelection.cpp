#include "LastSelection.hpp"
#include "Core/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

LastSelection::LastSelection(const Params &p)
        : p_(p)
{
    if (p_.path.empty())
        throw std::invalid_argument("LastSelection: path is empty");
}

void LastSelection::Save(const std::string &name) const
{
    const fs::path dir = fs::path(p_.path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        if (fs::create_directories(dir, ec))
        {
            fs::permissions(dir,
                            fs::perms::owner_all
                            | fs::perms::group_read | fs::perms::group_exec
                            | fs::perms::others_read | fs::perms::others_exec,
                            ec);
            LOGD("state") << "Created " << dir.string();
        }
        if (ec)
            throw std::runtime_error("create directory " + dir.string() + " failed: " + ec.message());
    }

    std::ofstream f(p_.path, std::ios::binary | std::ios::trunc);
    if (!f)
        throw std::runtime_error("open " + p_.path + " failed: " + std::strerror(errno));

    f << name;
    f.close();
    if (f.fail())
        throw std::runtime_error("write " + p_.path + " failed: " + std::strerror(errno));

    LOGD("state") << "Saved last selection '" << name << "' to " << p_.path;
}

std::optional<std::string> LastSelection::Load() const
{
    std::ifstream f(p_.path, std::ios::binary);
    if (!f)
    {
        const int err = errno;
        if (err == ENOENT)
            LOGD("state") << "No last selection at " << p_.path;
        else
            LOGW("state") << "Cannot open " << p_.path << ": " << std::strerror(err);
        return std::nullopt;
    }

    // filebuf::underflow бросает ios_base::failure при ошибке read() (EISDIR, EIO)
    std::string name;
    try
    {
        name.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }
    catch (const std::ios_base::failure &e)
    {
        LOGW("state") << "Read " << p_.path << " failed: " << e.what();
        return std::nullopt;
    }
    if (f.bad())
    {
        LOGW("state") << "Read " << p_.path << " failed: " << std::strerror(errno);
        return std::nullopt;
    }
    return name;
}
