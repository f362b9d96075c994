#include "generator/bit_layout.hpp"

namespace chronoid {
std::map<std::string, int64_t> DecodedId::toMap() const
{
    return {
        { "fid", fid }, { "msb", msb }, { "time_bucket", timeBucket }, { "seq", seq }, { "gid", gid },
    };
}

DecodedId decomposeId(int64_t fid) noexcept
{
    // Сдвигаем как беззнаковое, чтобы старший бит не размножался
    const auto bits = static_cast<uint64_t>(fid);

    DecodedId decoded {};
    decoded.fid = fid;
    decoded.msb = static_cast<int64_t>(bits >> 63);
    decoded.timeBucket = static_cast<int64_t>((bits >> SHIFT_TIME) & MAX_TIME_BUCKET);
    decoded.seq = static_cast<int64_t>((bits & MASK_SEQUENCE) >> SHIFT_SEQUENCE);
    decoded.gid = static_cast<int64_t>(bits & MASK_GENERATOR);
    return decoded;
}

std::ostream &operator<<(std::ostream &os, const DecodedId &decoded)
{
    return os << "{fid: " << decoded.fid << ", msb: " << decoded.msb
              << ", time_bucket: " << decoded.timeBucket << ", seq: " << decoded.seq
              << ", gid: " << decoded.gid << "}";
}
} // namespace chronoid
