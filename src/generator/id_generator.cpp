#include "generator/id_generator.hpp"

#include <chrono>

#include "codec/base62.hpp"
#include "utils/compiler.hpp"
#include "utils/logger.hpp"

namespace {
// Момент времени -> наносекунды от эпохи Unix
int64_t toNanoseconds(std::chrono::system_clock::time_point time)
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
}
} // namespace

namespace chronoid {
std::unique_ptr<IdGenerator> IdGenerator::create(const GeneratorConfig &config)
{
    const auto nowNs = toNanoseconds(config.getClock()());
    if (config.getEpochNs() > nowNs) {
        LOG_WARNING << "Эпоха генератора (" << config.getEpochNs()
                    << " нс) находится в будущем относительно текущего времени (" << nowNs
                    << " нс), генератор не создан";
        return nullptr;
    }

    // Конструктор закрытый, поэтому std::make_unique недоступен
    std::unique_ptr<IdGenerator> generator(new IdGenerator(config));
    LOG_INFO << "Создан генератор идентификаторов (GID: " << generator->generatorId_
             << ", эпоха: " << generator->epochNs_ << " нс)";
    return generator;
}

IdGenerator::IdGenerator(const GeneratorConfig &config)
    : epochNs_(config.getEpochNs())
    , epochBuckets_(config.getEpochNs() / BUCKET_LENGTH_NS)
    , generatorId_(config.getGeneratorId())
    , clock_(config.getClock())
    , sleeper_(config.getSleeper())
    // Исходное состояние "идентификаторы не выдавались": первый вызов либо перейдет
    // в более поздний интервал, либо переполнит нулевой и дождется первого
    , currentBucket_(0)
    , currentSeq_(MAX_SEQUENCE)
{
}

int64_t IdGenerator::nextId()
{
    std::lock_guard<std::mutex> lock(mutex_);

    const auto nowBucket = bucketsSince(nowNs());
    if (currentBucket_ < nowBucket) {
        currentBucket_ = nowBucket;
        currentSeq_ = 0;
    }
    else if (currentSeq_ < MAX_SEQUENCE) {
        // Интервал тот же (или часы отстают), продолжаем нумерацию
        currentSeq_++;
    }
    else {
        // Номера в текущем интервале закончились, ждем следующий
        currentBucket_++;
        currentSeq_ = 0;
        LOG_DEBUG << "Исчерпаны номера интервала, ожидание интервала " << currentBucket_;
        waitForCurrentBucket();
    }

    if (currentBucket_ > MAX_TIME_BUCKET) {
        CHRONOID_FATAL("generator over the time limit: bucket " << currentBucket_ << " > "
                                                                << MAX_TIME_BUCKET);
    }

    return composeId(currentBucket_, currentSeq_, generatorId_);
}

std::string IdGenerator::nextEncodedId()
{
    return encodeId(nextId());
}

uint16_t IdGenerator::generatorId() const
{
    return generatorId_;
}

int64_t IdGenerator::epochNs() const
{
    return epochNs_;
}

int64_t IdGenerator::epochBuckets() const
{
    return epochBuckets_;
}

int64_t IdGenerator::bucketsSince(int64_t nowNs) const
{
    return (nowNs - epochNs_) / BUCKET_LENGTH_NS;
}

int64_t IdGenerator::nowNs() const
{
    return toNanoseconds(clock_());
}

void IdGenerator::waitForCurrentBucket()
{
    const auto bucketStartNs = epochNs_ + currentBucket_ * BUCKET_LENGTH_NS;
    const auto delay = std::chrono::nanoseconds(bucketStartNs - nowNs());
    if (delay.count() > 0) {
        sleeper_(delay);
    }
}

DecodedId decodeId(int64_t fid) noexcept
{
    return decomposeId(fid);
}

std::string encodeId(int64_t fid)
{
    return codec::encode(static_cast<uint64_t>(fid));
}

int64_t decodeEncodedId(std::string_view sid, std::error_code &ec) noexcept
{
    return static_cast<int64_t>(codec::decode(sid, ec));
}
} // namespace chronoid
