#include "GzipCodec.h"

#include <array>
#include <string>

#include <zlib.h>

namespace SnAPI::StateSync
{

namespace
{
// windowBits 15 selects the maximum window; adding 16 selects the gzip wrapper.
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kMemLevel = 8;
constexpr std::size_t kChunkSize = 16 * 1024;

std::string ZlibMessage(const z_stream& Stream, int Code)
{
    return Stream.msg ? std::string(Stream.msg) : "zlib error " + std::to_string(Code);
}
} // namespace

TExpected<std::vector<uint8_t>> GzipCodec::Compress(std::span<const uint8_t> Input)
{
    z_stream Stream{};
    int Code = deflateInit2(&Stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
    if (Code != Z_OK)
    {
        return std::unexpected(MakeError(EErrorCode::SerializationFailed, "deflateInit2 failed: " + ZlibMessage(Stream, Code)));
    }

    std::vector<uint8_t> Output;
    Output.reserve(deflateBound(&Stream, static_cast<uLong>(Input.size())));
    Stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(Input.data()));
    Stream.avail_in = static_cast<uInt>(Input.size());

    std::array<uint8_t, kChunkSize> Chunk{};
    do
    {
        Stream.next_out = Chunk.data();
        Stream.avail_out = static_cast<uInt>(Chunk.size());
        Code = deflate(&Stream, Z_FINISH);
        if (Code == Z_STREAM_ERROR)
        {
            deflateEnd(&Stream);
            return std::unexpected(MakeError(EErrorCode::SerializationFailed, "deflate failed: " + ZlibMessage(Stream, Code)));
        }
        Output.insert(Output.end(), Chunk.begin(), Chunk.begin() + (Chunk.size() - Stream.avail_out));
    } while (Code != Z_STREAM_END);

    deflateEnd(&Stream);
    return Output;
}

TExpected<std::vector<uint8_t>> GzipCodec::Decompress(std::span<const uint8_t> Input)
{
    z_stream Stream{};
    int Code = inflateInit2(&Stream, kGzipWindowBits);
    if (Code != Z_OK)
    {
        return std::unexpected(MakeError(EErrorCode::DeserializationFailed, "inflateInit2 failed: " + ZlibMessage(Stream, Code)));
    }

    Stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(Input.data()));
    Stream.avail_in = static_cast<uInt>(Input.size());

    std::vector<uint8_t> Output;
    std::array<uint8_t, kChunkSize> Chunk{};
    do
    {
        Stream.next_out = Chunk.data();
        Stream.avail_out = static_cast<uInt>(Chunk.size());
        Code = inflate(&Stream, Z_NO_FLUSH);
        if (Code != Z_OK && Code != Z_STREAM_END)
        {
            const std::string Message = ZlibMessage(Stream, Code);
            inflateEnd(&Stream);
            return std::unexpected(MakeError(EErrorCode::DeserializationFailed, "inflate failed: " + Message));
        }
        Output.insert(Output.end(), Chunk.begin(), Chunk.begin() + (Chunk.size() - Stream.avail_out));
        if (Code != Z_STREAM_END && Stream.avail_in == 0 && Stream.avail_out != 0)
        {
            inflateEnd(&Stream);
            return std::unexpected(MakeError(EErrorCode::DeserializationFailed, "Truncated gzip stream"));
        }
    } while (Code != Z_STREAM_END);

    inflateEnd(&Stream);
    return Output;
}

} // namespace SnAPI::StateSync
