#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace chronoid::codec {
/**
 * @enum CodecError
 * @brief Ошибки декодирования строкового представления идентификатора
 */
enum class CodecError {
    INVALID_REPRESENTATION = 1, // Символ вне алфавита base62
};

/**
 * @brief Категория ошибок кодека ("chronoid.codec")
 * @return Ссылка на единственный экземпляр категории
 */
const std::error_category &codecCategory() noexcept;

/**
 * @brief Создает std::error_code для ошибки кодека
 * @param error Код ошибки
 * @return Объект std::error_code с категорией codecCategory()
 */
std::error_code make_error_code(CodecError error) noexcept;

/**
 * @brief Алфавит base62: сначала цифры, затем заглавные, затем строчные латинские буквы
 *
 * Порядок символов задает значение цифры: '0' = 0, 'A' = 10, 'a' = 36, 'z' = 61.
 */
inline constexpr std::string_view ALPHABET
    = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

/**
 * @brief Основание системы счисления
 */
inline constexpr uint64_t BASE = 62;

/**
 * @brief Кодирует число в строку base62
 *
 * Старшая цифра идет первой, ведущих нулей нет. Для 0 возвращается "0".
 *
 * @param value Кодируемое значение
 * @return Строковое представление минимальной длины
 */
std::string encode(uint64_t value);

/**
 * @brief Декодирует строку base62 в число
 *
 * Пустая строка декодируется в 0 без ошибки. При первом символе вне алфавита
 * разбор прекращается, возвращается 0, а в ec записывается
 * CodecError::INVALID_REPRESENTATION. Переполнение не проверяется: значение
 * накапливается по модулю 2^64.
 *
 * @param str Строковое представление
 * @param ec Код ошибки (очищается при успехе)
 * @return Декодированное значение или 0 при ошибке
 */
uint64_t decode(std::string_view str, std::error_code &ec) noexcept;

/**
 * @brief Декодирует строку base62 в число
 * @param str Строковое представление
 * @return Декодированное значение или std::nullopt, если строка некорректна
 */
std::optional<uint64_t> decode(std::string_view str) noexcept;
} // namespace chronoid::codec

namespace std {
template <> struct is_error_code_enum<chronoid::codec::CodecError> : true_type {};
} // namespace std
