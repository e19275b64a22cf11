#pragma once

// Profiles.hpp: профили DNS из конфига, имя -> упорядоченный список IP.
// Формат: { "dns": { "<name>": ["ip", ...], ... } }. После загрузки не меняется.

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

class Profiles
{
public:
    using Servers = std::vector<std::string>;

    Profiles() = default;

    // Чтение и разбор файла. std::runtime_error с путём в тексте при любой ошибке.
    static Profiles Load(const std::string &path);

    // Разбор уже прочитанного текста; origin идёт в сообщения об ошибках.
    static Profiles Parse(const std::string &text, const std::string &origin = "<config>");

    std::optional<Servers> Lookup(const std::string &name) const;

    std::vector<std::string> Names() const;

    std::size_t Size() const { return map_.size(); }

private:
    std::map<std::string, Servers> map_;
};
