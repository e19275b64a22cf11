#pragma once

// LastSelection.hpp: хранение имени последнего явно выбранного профиля между запусками.
// Файл содержит сырые байты имени без разделителей.

#include <optional>
#include <string>

class LastSelection
{
public:
    struct Params
    {
        std::string path = "/var/lib/dnsmng/last_dns";
    };

public:
    explicit LastSelection(const Params &p);

    // Создаёт родительский каталог (0755) при необходимости и перезаписывает файл.
    // std::runtime_error при ошибке.
    void Save(const std::string &name) const;

    // Содержимое файла как есть. Нет файла или ошибка чтения: std::nullopt (причина в логе).
    std::optional<std::string> Load() const;

    const std::string &Path() const { return p_.path; }

private:
    Params p_;
};
