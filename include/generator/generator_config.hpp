#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "generator/bit_layout.hpp"

namespace chronoid {
/**
 * @brief Источник текущего времени
 */
using Clock = std::function<std::chrono::system_clock::time_point()>;

/**
 * @brief Примитив ожидания: блокирует вызывающий поток на указанное время
 */
using Sleeper = std::function<void(std::chrono::nanoseconds)>;

/**
 * @class GeneratorConfig
 * @brief Параметры создания генератора идентификаторов.
 *
 * Значения проверяются в сеттерах и считываются один раз при создании
 * генератора, дальнейшие изменения конфигурации на него не влияют.
 *
 * @code
 * auto generator = IdGenerator::create(GeneratorConfig().setGeneratorId(42));
 * @endcode
 */
class GeneratorConfig {
public:
    /**
     * @brief Конфигурация по умолчанию: идентификатор генератора 0, эпоха
     * 2020-01-01T00:00:00Z, системные часы и std::this_thread::sleep_for
     */
    GeneratorConfig();

    /**
     * @brief Задает идентификатор генератора
     *
     * Значение больше MAX_GENERATOR_ID является ошибкой программиста и
     * аварийно завершает процесс. Уникальность идентификатора среди всех
     * генераторов обеспечивает вызывающий код.
     *
     * @param generatorId Идентификатор генератора
     * @return Ссылка на текущую конфигурацию
     */
    GeneratorConfig &setGeneratorId(uint16_t generatorId);

    /**
     * @brief Задает эпоху генератора
     * @param epoch Момент, от которого отсчитываются временные интервалы
     * @return Ссылка на текущую конфигурацию
     */
    GeneratorConfig &setEpoch(std::chrono::system_clock::time_point epoch);

    /**
     * @brief Задает эпоху генератора в наносекундах от эпохи Unix
     * @param epochNs Эпоха в наносекундах
     * @return Ссылка на текущую конфигурацию
     */
    GeneratorConfig &setEpochNs(int64_t epochNs);

    /**
     * @brief Подменяет источник текущего времени (используется в тестах)
     * @param clock Источник времени, пустая функция возвращает системные часы
     * @return Ссылка на текущую конфигурацию
     */
    GeneratorConfig &setClock(Clock clock);

    /**
     * @brief Подменяет примитив ожидания (используется в тестах)
     * @param sleeper Примитив ожидания, пустая функция возвращает std::this_thread::sleep_for
     * @return Ссылка на текущую конфигурацию
     */
    GeneratorConfig &setSleeper(Sleeper sleeper);

    uint16_t getGeneratorId() const;
    int64_t getEpochNs() const;
    const Clock &getClock() const;
    const Sleeper &getSleeper() const;

    /**
     * @brief Системные часы
     */
    static std::chrono::system_clock::time_point systemClock();

    /**
     * @brief Ожидание средствами std::this_thread::sleep_for
     */
    static void systemSleeper(std::chrono::nanoseconds duration);

private:
    uint16_t generatorId_; // Идентификатор генератора
    int64_t epochNs_; // Эпоха в наносекундах от эпохи Unix
    Clock clock_; // Источник текущего времени
    Sleeper sleeper_; // Примитив ожидания
};
} // namespace chronoid
