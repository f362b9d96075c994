#include "codec/base62.hpp"

#include <array>

namespace {
// Признак отсутствия символа в алфавите
constexpr uint8_t INVALID_DIGIT = 0xFF;

// Максимальная длина строки для uint64_t: 62^10 < 2^64 < 62^11
constexpr size_t MAX_ENCODED_LENGTH = 11;

// Обратная таблица: код символа -> значение цифры
constexpr std::array<uint8_t, 256> buildReverseTable()
{
    std::array<uint8_t, 256> table {};
    for (auto &entry : table) {
        entry = INVALID_DIGIT;
    }
    for (size_t i = 0; i < chronoid::codec::ALPHABET.size(); i++) {
        table[static_cast<unsigned char>(chronoid::codec::ALPHABET[i])] = static_cast<uint8_t>(i);
    }
    return table;
}

constexpr std::array<uint8_t, 256> REVERSE_TABLE = buildReverseTable();

static_assert(chronoid::codec::ALPHABET.size() == chronoid::codec::BASE);
static_assert(REVERSE_TABLE['z'] == 61);

class CodecCategory : public std::error_category {
public:
    const char *name() const noexcept override
    {
        return "chronoid.codec";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<chronoid::codec::CodecError>(condition)) {
        case chronoid::codec::CodecError::INVALID_REPRESENTATION:
            return "invalid base62 representation";
        }
        return "unknown codec error";
    }
};
} // namespace

namespace chronoid::codec {
const std::error_category &codecCategory() noexcept
{
    static const CodecCategory category;
    return category;
}

std::error_code make_error_code(CodecError error) noexcept
{
    return { static_cast<int>(error), codecCategory() };
}

std::string encode(uint64_t value)
{
    if (value == 0) {
        return "0";
    }

    // Заполняем буфер с конца, младшая цифра попадает в последнюю позицию
    std::array<char, MAX_ENCODED_LENGTH> buffer {};
    size_t pos = buffer.size();
    while (value != 0) {
        buffer[--pos] = ALPHABET[value % BASE];
        value /= BASE;
    }

    return std::string(buffer.data() + pos, buffer.size() - pos);
}

uint64_t decode(std::string_view str, std::error_code &ec) noexcept
{
    ec.clear();

    uint64_t result = 0;
    for (const char symbol : str) {
        const auto digit = REVERSE_TABLE[static_cast<unsigned char>(symbol)];
        if (digit == INVALID_DIGIT) {
            ec = make_error_code(CodecError::INVALID_REPRESENTATION);
            return 0;
        }
        result = result * BASE + digit;
    }
    return result;
}

std::optional<uint64_t> decode(std::string_view str) noexcept
{
    std::error_code ec;
    const auto value = decode(str, ec);
    if (ec) {
        return std::nullopt;
    }
    return value;
}
} // namespace chronoid::codec
