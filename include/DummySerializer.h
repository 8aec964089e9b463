#pragma once

#include "Serializer.h"
#include "StateSaveTypes.h"

namespace SnAPI::StateSync
{

/**
 * @brief Serializer that neither reads nor writes.
 * @remarks
 * Drives participant code through its change detection without touching any
 * buffer. Paired with EStateSaveOption::DontSerialize it answers "would this
 * participant produce data", and it captures initial baselines at end of
 * frame. Reading leaves every value untouched.
 */
class DummySerializer final : public ISerializer
{
public:
    explicit DummySerializer(bool InIsReading = false, uint16_t InVersion = kCurrentBinaryVersion)
        : m_isReading(InIsReading)
        , m_version(InVersion)
    {
    }

    bool IsReading() const override
    {
        return m_isReading;
    }

    uint16_t Version() const override
    {
        return m_version;
    }

    bool IsNoOp() const override
    {
        return true;
    }

    using ISerializer::Serialize;
    using ISerializer::SerializeCompressed;

    void Serialize(bool&) override {}
    void Serialize(char&) override {}
    void Serialize(int8_t&) override {}
    void Serialize(uint8_t&) override {}
    void Serialize(int16_t&) override {}
    void Serialize(uint16_t&) override {}
    void Serialize(int32_t&) override {}
    void Serialize(uint32_t&) override {}
    void Serialize(int64_t&) override {}
    void Serialize(uint64_t&) override {}
    void Serialize(float&) override {}
    void Serialize(double&) override {}
    void Serialize(std::string&) override {}
    void Serialize(Uuid&) override {}
    void Serialize(std::vector<uint8_t>&) override {}

    void SerializeCompressed(uint64_t&) override {}
    void SerializeCompressed(int64_t&) override {}

private:
    bool m_isReading = false; /**< @brief Direction reported to participants. */
    uint16_t m_version = kCurrentBinaryVersion; /**< @brief Version reported to participants. */
};

} // namespace SnAPI::StateSync
