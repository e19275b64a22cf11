#pragma once
// ResolvConf.hpp: запись списка nameserver в плоский resolv.conf.
// Полная перезапись с усечением, без бэкапа и без частичного восстановления.

#include <string>
#include <vector>

class ResolvConf
{
public:
    struct Params
    {
        std::string path = "/etc/resolv.conf";
    };

public:
    explicit ResolvConf(const Params &p);

    // Перезаписать файл строками "nameserver <ip>\n" в порядке servers.
    // std::runtime_error при ошибке открытия/записи; файл при этом в неопределённом состоянии.
    void Apply(const std::vector<std::string> &servers) const;

    static std::string Render(const std::vector<std::string> &servers);

    const std::string &Path() const { return p_.path; }

private:
    Params p_;
};
