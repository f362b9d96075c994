#include <gtest/gtest.h>
#include <chrono>

#include "generator/generator_config.hpp"
#include "testing_utils.hpp"

namespace chronoid::tests {
// Проверка значений по умолчанию
TEST(GeneratorConfigTest, Defaults)
{
    const GeneratorConfig config;

    EXPECT_EQ(DEFAULT_GENERATOR_ID, config.getGeneratorId());
    EXPECT_EQ(DEFAULT_EPOCH_NS, config.getEpochNs());
    ASSERT_TRUE(config.getClock());
    ASSERT_TRUE(config.getSleeper());

    // Часы по умолчанию - системные
    const auto before = std::chrono::system_clock::now();
    const auto now = config.getClock()();
    const auto after = std::chrono::system_clock::now();
    EXPECT_LE(before, now);
    EXPECT_LE(now, after);
}

// Проверка сеттеров
TEST(GeneratorConfigTest, Setters)
{
    ManualClock clock(bucketStartNs(100));

    GeneratorConfig config;
    config.setGeneratorId(MAX_GENERATOR_ID)
        .setEpoch(fromNanoseconds(bucketStartNs(50)))
        .setClock(clock.asClock())
        .setSleeper(clock.asSleeper());

    EXPECT_EQ(MAX_GENERATOR_ID, config.getGeneratorId());
    EXPECT_EQ(bucketStartNs(50), config.getEpochNs());
    EXPECT_EQ(fromNanoseconds(bucketStartNs(100)), config.getClock()());

    config.getSleeper()(std::chrono::milliseconds(3));
    EXPECT_EQ(bucketStartNs(100) + 3000000, clock.nowNs());

    config.setEpochNs(42);
    EXPECT_EQ(42, config.getEpochNs());
}

// Пустые функции заменяются системными
TEST(GeneratorConfigTest, EmptyCollaboratorsFallBackToSystem)
{
    GeneratorConfig config;
    config.setClock(Clock {}).setSleeper(Sleeper {});

    ASSERT_TRUE(config.getClock());
    ASSERT_TRUE(config.getSleeper());
    EXPECT_GT(config.getClock()().time_since_epoch().count(), 0);
}

// Слишком большой идентификатор генератора - ошибка программиста
TEST(GeneratorConfigDeathTest, GeneratorIdOutOfBounds)
{
    EXPECT_DEATH(GeneratorConfig().setGeneratorId(MAX_GENERATOR_ID + 1),
                 "generator ID out of bounds");
    EXPECT_DEATH(GeneratorConfig().setGeneratorId(10000), "generator ID out of bounds");
}
} // namespace chronoid::tests
