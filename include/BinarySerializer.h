#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "Export.h"
#include "Serializer.h"
#include "StateSaveTypes.h"

namespace SnAPI::StateSync
{

/**
 * @brief ISerializer over an in-memory byte buffer.
 * @remarks
 * Writing appends to a caller-owned vector; reading consumes a caller-owned
 * span, which must outlive the serializer. Both directions run on cereal
 * binary archives. Multi-byte primitives use the host byte order, which is
 * little-endian on every supported target.
 *
 * Reading supports random access through Position()/Seek(), which the
 * orchestrator uses to skip a failed record by its declared length.
 */
class SNAPI_STATESYNC_API BinarySerializer final : public ISerializer
{
public:
    /**
     * @brief Create a writer appending to Output.
     * @param Output Destination buffer; existing contents are kept.
     * @param InVersion Version reported to participants.
     */
    explicit BinarySerializer(std::vector<uint8_t>& Output, uint16_t InVersion = kCurrentBinaryVersion);

    /**
     * @brief Create a reader over Input.
     * @param Input Source bytes.
     * @param InVersion Binary version the bytes were written with.
     */
    BinarySerializer(std::span<const uint8_t> Input, uint16_t InVersion);

    ~BinarySerializer() override;

    BinarySerializer(const BinarySerializer&) = delete;
    BinarySerializer& operator=(const BinarySerializer&) = delete;

    bool IsReading() const override;
    uint16_t Version() const override;

    using ISerializer::Serialize;
    using ISerializer::SerializeCompressed;

    void Serialize(bool& Value) override;
    void Serialize(char& Value) override;
    void Serialize(int8_t& Value) override;
    void Serialize(uint8_t& Value) override;
    void Serialize(int16_t& Value) override;
    void Serialize(uint16_t& Value) override;
    void Serialize(int32_t& Value) override;
    void Serialize(uint32_t& Value) override;
    void Serialize(int64_t& Value) override;
    void Serialize(uint64_t& Value) override;
    void Serialize(float& Value) override;
    void Serialize(double& Value) override;
    void Serialize(std::string& Value) override;
    void Serialize(Uuid& Value) override;
    void Serialize(std::vector<uint8_t>& Value) override;

    void SerializeCompressed(uint64_t& Value) override;
    void SerializeCompressed(int64_t& Value) override;

    /**
     * @brief Current byte offset (read cursor, or bytes written so far).
     */
    std::size_t Position() const;

    /**
     * @brief Move the read cursor to an absolute offset.
     * @throws SerializationException OutOfRange when Offset is past the end,
     * InvalidArgument when called on a writer.
     */
    void Seek(std::size_t Offset);

    /**
     * @brief Total bytes in the input (reader) or output (writer).
     */
    std::size_t Size() const;

    /**
     * @brief Bytes left to read. Zero for writers.
     */
    std::size_t Remaining() const;

    bool AtEnd() const
    {
        return Remaining() == 0;
    }

    /**
     * @brief Append bytes verbatim, without a length prefix.
     */
    void WriteRaw(std::span<const uint8_t> Bytes);

    /**
     * @brief Read Count bytes verbatim.
     * @throws SerializationException DeserializationFailed when fewer remain.
     */
    std::vector<uint8_t> ReadRaw(std::size_t Count);

    /**
     * @brief Map a signed value to unsigned so that small magnitudes stay small.
     */
    static constexpr uint64_t ZigZagEncode(int64_t Value)
    {
        return (static_cast<uint64_t>(Value) << 1) ^ static_cast<uint64_t>(Value >> 63);
    }

    static constexpr int64_t ZigZagDecode(uint64_t Value)
    {
        return static_cast<int64_t>(Value >> 1) ^ -static_cast<int64_t>(Value & 1);
    }

    /** @brief Longest LEB128 encoding of a 64-bit value. */
    static constexpr std::size_t kMaxVarIntBytes = 10;

protected:
    void CheckReadableCount(uint64_t Count) const override;

private:
    struct State;

    template<typename T>
    void SerializePrimitive(T& Value);

    std::unique_ptr<State> m_state; /**< @brief Archive and stream buffer of the active direction. */
    uint16_t m_version = kCurrentBinaryVersion; /**< @brief Version reported to participants. */
};

} // namespace SnAPI::StateSync
