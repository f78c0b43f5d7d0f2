/**
 * @file json.hpp
 * @brief Минималистичный JSON разбор и экранирование
 * 
 * Не использует внешние библиотеки. Достаточен для ответов индексатора:
 * поиск полей объекта верхнего уровня, разбиение массивов, строки
 * с escape-последовательностями.
 * 
 * Все функции работают с представлениями (string_view) на исходный текст,
 * поэтому исходная строка должна жить дольше результатов.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sealchain::json {

/**
 * @brief Найти сырое значение поля в JSON объекте
 * 
 * Ищет только среди полей верхнего уровня переданного объекта,
 * вложенные объекты не просматриваются.
 * 
 * @param object Текст JSON объекта ("{...}")
 * @param key Имя поля
 * @return Сырой текст значения (строки вместе с кавычками)
 */
[[nodiscard]] std::optional<std::string_view> find_member(std::string_view object, std::string_view key);

/**
 * @brief Значение является null
 */
[[nodiscard]] bool is_null(std::string_view raw) noexcept;

/**
 * @brief Строковое поле (nullopt если отсутствует, null или не строка)
 */
[[nodiscard]] std::optional<std::string> get_string(std::string_view object, std::string_view key);

/**
 * @brief Целое поле; принимает число или строку с числом (BigInt)
 */
[[nodiscard]] std::optional<int64_t> get_int(std::string_view object, std::string_view key);

/**
 * @brief Неотрицательное целое поле; принимает число или строку с числом
 */
[[nodiscard]] std::optional<uint64_t> get_uint(std::string_view object, std::string_view key);

[[nodiscard]] std::optional<bool> get_bool(std::string_view object, std::string_view key);

/**
 * @brief Разбить JSON массив на сырые элементы
 * 
 * @return nullopt если текст не является массивом
 */
[[nodiscard]] std::optional<std::vector<std::string_view>> split_array(std::string_view array);

/**
 * @brief Экранировать строку для вставки в JSON (без внешних кавычек)
 */
[[nodiscard]] std::string escape(std::string_view text);

/**
 * @brief Раскодировать строковый литерал JSON (с кавычками)
 * 
 * Поддерживает \uXXXX включая суррогатные пары.
 */
[[nodiscard]] std::optional<std::string> unescape(std::string_view quoted);

} // namespace sealchain::json
