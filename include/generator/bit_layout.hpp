#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <ostream>
#include <string>

namespace chronoid {
/**
 * Раскладка битов идентификатора (от старшего к младшему):
 *
 *   1 бит  - зарезервирован (знаковый бит, всегда 0)
 *  38 бит  - номер временного интервала (10 мс) от эпохи генератора
 *  13 бит  - порядковый номер внутри интервала
 *  12 бит  - идентификатор генератора
 *
 * Отсюда: время жизни ~87 лет от эпохи, до 8192 идентификаторов за 10 мс
 * на один генератор, до 4096 генераторов.
 */

// Длительность одного временного интервала
inline constexpr std::chrono::nanoseconds BUCKET_LENGTH = std::chrono::milliseconds(10);
inline constexpr int64_t BUCKET_LENGTH_NS = BUCKET_LENGTH.count();

// Ширина полей в битах
inline constexpr int BITS_TIME = 38;
inline constexpr int BITS_SEQUENCE = 13;
inline constexpr int BITS_GENERATOR = 63 - BITS_TIME - BITS_SEQUENCE;

static_assert(BITS_TIME + BITS_SEQUENCE + BITS_GENERATOR == 63,
              "Поля идентификатора должны занимать ровно 63 бита");

// Сдвиги полей
inline constexpr int SHIFT_SEQUENCE = BITS_GENERATOR;
inline constexpr int SHIFT_TIME = BITS_SEQUENCE + BITS_GENERATOR;

// Максимальные значения полей
inline constexpr int64_t MAX_TIME_BUCKET = (int64_t { 1 } << BITS_TIME) - 1;
inline constexpr uint16_t MAX_SEQUENCE = (1U << BITS_SEQUENCE) - 1;
inline constexpr uint16_t MAX_GENERATOR_ID = (1U << BITS_GENERATOR) - 1;

// Маски полей на своих позициях
inline constexpr int64_t MASK_TIME = MAX_TIME_BUCKET << SHIFT_TIME;
inline constexpr int64_t MASK_SEQUENCE = int64_t { MAX_SEQUENCE } << SHIFT_SEQUENCE;
inline constexpr int64_t MASK_GENERATOR = MAX_GENERATOR_ID;

// Эпоха по умолчанию: 2020-01-01T00:00:00Z в наносекундах от эпохи Unix
inline constexpr int64_t DEFAULT_EPOCH_NS = 1577836800000000000;

// Идентификатор генератора по умолчанию
inline constexpr uint16_t DEFAULT_GENERATOR_ID = 0;

/**
 * @struct DecodedId
 * @brief Поля, извлеченные из идентификатора
 */
struct DecodedId {
    int64_t fid; // Исходный идентификатор
    int64_t msb; // Зарезервированный старший бит (0 для корректных идентификаторов)
    int64_t timeBucket; // Номер временного интервала
    int64_t seq; // Порядковый номер внутри интервала
    int64_t gid; // Идентификатор генератора

    /**
     * @brief Представляет поля в виде словаря с ключами fid, msb, time_bucket, seq, gid
     * @return Словарь "имя поля -> значение"
     */
    std::map<std::string, int64_t> toMap() const;

    bool operator==(const DecodedId &other) const
    {
        return fid == other.fid && msb == other.msb && timeBucket == other.timeBucket
               && seq == other.seq && gid == other.gid;
    }

    bool operator!=(const DecodedId &other) const
    {
        return !(*this == other);
    }
};

/**
 * @brief Собирает идентификатор из полей
 *
 * Значения полей должны укладываться в свою ширину, это проверяет вызывающий код.
 *
 * @param bucket Номер временного интервала
 * @param seq Порядковый номер внутри интервала
 * @param gid Идентификатор генератора
 * @return Идентификатор
 */
constexpr int64_t composeId(int64_t bucket, uint16_t seq, uint16_t gid) noexcept
{
    return (bucket << SHIFT_TIME) | (int64_t { seq } << SHIFT_SEQUENCE) | int64_t { gid };
}

/**
 * @brief Раскладывает идентификатор на поля
 *
 * Функция чистая и не требует экземпляра генератора. Ненулевой msb означает,
 * что значение не было выдано генератором, проверка остается за вызывающим кодом.
 *
 * @param fid Идентификатор
 * @return Поля идентификатора
 */
DecodedId decomposeId(int64_t fid) noexcept;

std::ostream &operator<<(std::ostream &os, const DecodedId &decoded);
} // namespace chronoid
