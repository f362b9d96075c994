#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

#include "generator/generator_config.hpp"

namespace chronoid::tests {
/**
 * @brief Переводит наносекунды от эпохи Unix в момент системных часов
 * @param ns Наносекунды от эпохи Unix
 * @return Момент времени
 */
std::chrono::system_clock::time_point fromNanoseconds(int64_t ns);

/**
 * @brief Начало временного интервала bucket для эпохи по умолчанию
 * @param bucket Номер интервала
 * @return Наносекунды от эпохи Unix
 */
int64_t bucketStartNs(int64_t bucket);

/**
 * @class DeterministicClock
 * @brief Часы, которые при каждом чтении возвращают текущее значение и сдвигаются на tick
 *
 * Потокобезопасны. Объект должен жить дольше генератора, которому передан.
 */
class DeterministicClock {
public:
    DeterministicClock(std::chrono::system_clock::time_point start, std::chrono::nanoseconds tick);

    std::chrono::system_clock::time_point operator()();

    /**
     * @brief Функция для GeneratorConfig::setClock, ссылающаяся на этот объект
     */
    Clock asClock();

private:
    std::mutex mutex_;
    std::chrono::system_clock::time_point current_;
    const std::chrono::nanoseconds tick_;
};

/**
 * @class ManualClock
 * @brief Часы, которые двигаются только явно, и примитив ожидания для них
 *
 * Ожидание не блокирует поток, а сдвигает часы на запрошенное время и
 * запоминает его, чтобы тест мог проверить факт ожидания.
 */
class ManualClock {
public:
    explicit ManualClock(int64_t startNs);

    int64_t nowNs() const;
    void advance(std::chrono::nanoseconds duration);

    Clock asClock();
    Sleeper asSleeper();

    /**
     * @brief Все запрошенные ожидания в порядке вызова
     */
    std::vector<std::chrono::nanoseconds> sleeps() const;

private:
    std::atomic<int64_t> nowNs_;
    mutable std::mutex sleepsMutex_;
    std::vector<std::chrono::nanoseconds> sleeps_;
};
} // namespace chronoid::tests
