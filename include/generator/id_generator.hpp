#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>

#include "generator/bit_layout.hpp"
#include "generator/generator_config.hpp"

namespace chronoid {
/**
 * @class IdGenerator
 * @brief Генерирует уникальные упорядоченные по времени 64-битные идентификаторы.
 *
 * Идентификатор состоит из номера 10-миллисекундного интервала от эпохи,
 * порядкового номера внутри интервала и идентификатора генератора (см.
 * bit_layout.hpp). Все вызовы nextId() сериализуются одним мьютексом, поэтому
 * генератор можно использовать из любого числа потоков.
 *
 * Если за один интервал запрошено больше MAX_SEQUENCE + 1 идентификаторов,
 * вызывающий поток ждет начала следующего интервала, удерживая мьютекс.
 * Так пары (интервал, номер) никогда не повторяются, а интервалы выдаются
 * в неубывающем порядке.
 */
class IdGenerator {
public:
    /**
     * @brief Создает генератор
     * @param config Параметры генератора
     * @return Генератор или nullptr, если эпоха находится в будущем относительно config.getClock()
     */
    static std::unique_ptr<IdGenerator> create(const GeneratorConfig &config = {});

    // Запрещаем копирование и перемещение
    IdGenerator(const IdGenerator &) = delete;
    IdGenerator &operator=(const IdGenerator &) = delete;
    IdGenerator(IdGenerator &&) = delete;
    IdGenerator &operator=(IdGenerator &&) = delete;

    /**
     * @brief Выдает следующий идентификатор
     *
     * Может заблокировать поток до начала следующего интервала. Когда
     * пространство интервалов исчерпано (прошло ~87 лет от эпохи), процесс
     * аварийно завершается: корректный идентификатор выдать уже нельзя.
     *
     * @return Неотрицательный идентификатор
     */
    int64_t nextId();

    /**
     * @brief Выдает следующий идентификатор в представлении base62
     * @return Строковый идентификатор
     */
    std::string nextEncodedId();

    uint16_t generatorId() const;
    int64_t epochNs() const;

    /**
     * @brief Эпоха генератора, выраженная в интервалах от эпохи Unix
     */
    int64_t epochBuckets() const;

private:
    explicit IdGenerator(const GeneratorConfig &config);

    /**
     * @brief Число интервалов между эпохой генератора и указанным моментом
     * @param nowNs Момент в наносекундах от эпохи Unix
     */
    int64_t bucketsSince(int64_t nowNs) const;

    /**
     * @brief Текущее время по часам генератора в наносекундах от эпохи Unix
     */
    int64_t nowNs() const;

    /**
     * @brief Ждет начала интервала currentBucket_ (вызывается под mutex_)
     */
    void waitForCurrentBucket();

    const int64_t epochNs_; // Эпоха в наносекундах от эпохи Unix
    const int64_t epochBuckets_; // Эпоха в интервалах от эпохи Unix
    const uint16_t generatorId_; // Идентификатор генератора
    const Clock clock_; // Источник текущего времени
    const Sleeper sleeper_; // Примитив ожидания

    // Состояние, изменяемое только под mutex_
    int64_t currentBucket_; // Интервал, в котором выдан последний идентификатор
    uint16_t currentSeq_; // Последний выданный порядковый номер в currentBucket_
    std::mutex mutex_;
};

/**
 * @brief Раскладывает идентификатор на поля (без блокировок)
 * @param fid Идентификатор
 * @return Поля fid, msb, time_bucket, seq, gid
 */
DecodedId decodeId(int64_t fid) noexcept;

/**
 * @brief Кодирует идентификатор в base62
 * @param fid Идентификатор
 * @return Строковое представление
 */
std::string encodeId(int64_t fid);

/**
 * @brief Декодирует строковое представление идентификатора
 * @param sid Строка base62
 * @param ec Ошибка кодека (codec::CodecError::INVALID_REPRESENTATION) или пустой код
 * @return Идентификатор или 0 при ошибке
 */
int64_t decodeEncodedId(std::string_view sid, std::error_code &ec) noexcept;
} // namespace chronoid
