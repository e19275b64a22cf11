#pragma once

#include "Profiles.hpp"

#include <string>
#include <vector>

class ResolvConf;
class LastSelection;

/**
 * @file Restore.hpp
 * @brief Выбор и применение профиля при старте.
 *
 * Явный выбор: lookup -> запись resolv.conf -> сохранение выбора.
 * Без выбора: последний сохранённый профиль, иначе профиль по умолчанию ("local");
 * выбор при этом не пересохраняется.
 * Любая ошибка, кроме чтения сохранённого выбора, фатальна: std::runtime_error.
 */
class Restore
{
public:
    static constexpr const char *kDefaultProfile = "local";

    struct Params
    {
        std::string requested;                  ///< Явно выбранный профиль, пусто: последний/по умолчанию.
        std::string fallback = kDefaultProfile; ///< Профиль, если сохранённого выбора нет.
    };

    /**
     * @brief Итог старта: активный профиль и его адреса.
     *
     * servers вычисляются один раз и дальше используются вотчером как есть.
     */
    struct Result
    {
        std::string profile;
        Profiles::Servers servers;
        bool explicit_selection = false;
    };

    /**
     * @param profiles Загруженные профили.
     * @param resolv   Куда писать nameserver.
     * @param last     Хранилище последнего выбора.
     */
    Restore(const Profiles &profiles,
            const ResolvConf &resolv,
            const LastSelection &last);

    /**
     * @brief Определить активный профиль и применить его.
     * @throws std::runtime_error Неизвестный профиль, ошибка записи resolv.conf,
     *         ошибка сохранения явного выбора.
     */
    Result Run(const Params &p) const;

private:
    Result Select_(const std::string &requested) const;
    Result RestoreLast_(const std::string &fallback) const;
    Profiles::Servers Resolve_(const std::string &name) const;
    void Apply_(const std::string &name, const Profiles::Servers &servers) const;

private:
    const Profiles      &profiles_;
    const ResolvConf    &resolv_;
    const LastSelection &last_;
};
