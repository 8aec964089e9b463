#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "Expected.h"
#include "Export.h"

namespace SnAPI::StateSync
{

/**
 * @brief Gzip-wrapped deflate compression of stream bodies (zlib).
 */
class SNAPI_STATESYNC_API GzipCodec
{
public:
    /**
     * @brief Compress Input into a gzip member.
     * @return SerializationFailed when zlib reports an error.
     */
    static TExpected<std::vector<uint8_t>> Compress(std::span<const uint8_t> Input);

    /**
     * @brief Inflate a gzip member.
     * @return DeserializationFailed for corrupt or truncated input.
     */
    static TExpected<std::vector<uint8_t>> Decompress(std::span<const uint8_t> Input);
};

} // namespace SnAPI::StateSync
