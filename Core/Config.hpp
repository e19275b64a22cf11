#pragma once

/**
 * @file Config.hpp
 * @brief Чтение конфигурационных файлов и строгий доступ к полям boost::json.
 *
 * Все функции бросают std::runtime_error с именем ключа/файла в тексте,
 * чтобы ошибку можно было показать пользователю как есть.
 */

#include <boost/json.hpp>

#include <string>
#include <vector>

namespace Config
{
    /**
     * @brief Прочитать файл целиком.
     * @param path Путь к файлу.
     * @return Содержимое файла.
     * @throws std::runtime_error Файл не открывается или не читается.
     */
    std::string ReadFile(const std::string &path);

    /**
     * @brief Разобрать JSON.
     * @param text   Текст документа.
     * @param origin Откуда текст (путь), для сообщения об ошибке.
     * @throws std::runtime_error Синтаксическая ошибка.
     */
    boost::json::value Parse(const std::string &text, const std::string &origin);

    const boost::json::object &RequireObject(const boost::json::object &o, const char *key);

    /**
     * @brief Массив строк с сохранением порядка.
     * @param what Имя значения для сообщения об ошибке (например "dns.local").
     * @throws std::runtime_error Значение не массив или содержит не-строку.
     */
    std::vector<std::string> RequireStringArray(const boost::json::value &v, const std::string &what);
}
