#include "generator/generator_config.hpp"

#include <thread>
#include <utility>

#include "utils/compiler.hpp"

namespace chronoid {
GeneratorConfig::GeneratorConfig()
    : generatorId_(DEFAULT_GENERATOR_ID)
    , epochNs_(DEFAULT_EPOCH_NS)
    , clock_(&GeneratorConfig::systemClock)
    , sleeper_(&GeneratorConfig::systemSleeper)
{
}

GeneratorConfig &GeneratorConfig::setGeneratorId(uint16_t generatorId)
{
    if (generatorId > MAX_GENERATOR_ID) {
        CHRONOID_FATAL("generator ID out of bounds: " << generatorId << " > " << MAX_GENERATOR_ID);
    }
    generatorId_ = generatorId;
    return *this;
}

GeneratorConfig &GeneratorConfig::setEpoch(std::chrono::system_clock::time_point epoch)
{
    return setEpochNs(
        std::chrono::duration_cast<std::chrono::nanoseconds>(epoch.time_since_epoch()).count());
}

GeneratorConfig &GeneratorConfig::setEpochNs(int64_t epochNs)
{
    epochNs_ = epochNs;
    return *this;
}

GeneratorConfig &GeneratorConfig::setClock(Clock clock)
{
    clock_ = clock ? std::move(clock) : Clock(&GeneratorConfig::systemClock);
    return *this;
}

GeneratorConfig &GeneratorConfig::setSleeper(Sleeper sleeper)
{
    sleeper_ = sleeper ? std::move(sleeper) : Sleeper(&GeneratorConfig::systemSleeper);
    return *this;
}

uint16_t GeneratorConfig::getGeneratorId() const
{
    return generatorId_;
}

int64_t GeneratorConfig::getEpochNs() const
{
    return epochNs_;
}

const Clock &GeneratorConfig::getClock() const
{
    return clock_;
}

const Sleeper &GeneratorConfig::getSleeper() const
{
    return sleeper_;
}

std::chrono::system_clock::time_point GeneratorConfig::systemClock()
{
    return std::chrono::system_clock::now();
}

void GeneratorConfig::systemSleeper(std::chrono::nanoseconds duration)
{
    std::this_thread::sleep_for(duration);
}
} // namespace chronoid
