#include "BinarySerializer.h"

#include <array>
#include <cstring>
#include <istream>
#include <ostream>
#include <streambuf>
#include <string>

#include <cereal/archives/binary.hpp>
#include <cereal/cereal.hpp>
#include <cereal/types/array.hpp>

namespace cereal
{

/**
 * @brief cereal save function for Uuid: 16 raw bytes.
 */
template <class Archive>
void save(Archive& ArchiveRef, const SnAPI::StateSync::Uuid& Id)
{
    const std::array<uint8_t, 16> Data = SnAPI::StateSync::ToBytes(Id);
    ArchiveRef(Data);
}

/**
 * @brief cereal load function for Uuid: 16 raw bytes.
 */
template <class Archive>
void load(Archive& ArchiveRef, SnAPI::StateSync::Uuid& Id)
{
    std::array<uint8_t, 16> Data{};
    ArchiveRef(Data);
    Id = SnAPI::StateSync::FromBytes(Data);
}

} // namespace cereal

namespace SnAPI::StateSync
{

namespace
{
/**
 * @brief Streambuf that appends archive output directly into a vector.
 * @remarks Unbuffered, so the vector size is the exact write position at
 * any time.
 */
class VectorWriteStreambuf final : public std::streambuf
{
public:
    explicit VectorWriteStreambuf(std::vector<uint8_t>& Buffer)
        : m_buffer(Buffer)
    {
    }

    std::vector<uint8_t>& Buffer()
    {
        return m_buffer;
    }

protected:
    int_type overflow(int_type Ch) override
    {
        if (traits_type::eq_int_type(Ch, traits_type::eof()))
        {
            return traits_type::eof();
        }
        m_buffer.push_back(static_cast<uint8_t>(Ch));
        return Ch;
    }

    std::streamsize xsputn(const char* Data, std::streamsize Count) override
    {
        if (!Data || Count <= 0)
        {
            return 0;
        }
        const auto Size = static_cast<size_t>(Count);
        const size_t Offset = m_buffer.size();
        m_buffer.resize(Offset + Size);
        std::memcpy(m_buffer.data() + Offset, Data, Size);
        return Count;
    }

private:
    std::vector<uint8_t>& m_buffer; /**< @brief Destination byte vector reference. */
};

/**
 * @brief Streambuf exposing immutable memory as a seekable input stream.
 * @remarks cereal reads through rdbuf()->sgetn, so the get area pointer is
 * the authoritative read position.
 */
class MemoryReadStreambuf final : public std::streambuf
{
public:
    MemoryReadStreambuf(const uint8_t* Data, size_t Size)
    {
        if (!Data || Size == 0)
        {
            setg(nullptr, nullptr, nullptr);
            return;
        }
        char* Begin = const_cast<char*>(reinterpret_cast<const char*>(Data));
        setg(Begin, Begin, Begin + static_cast<std::streamsize>(Size));
    }

    size_t Position() const
    {
        return static_cast<size_t>(gptr() - eback());
    }

    size_t Size() const
    {
        return static_cast<size_t>(egptr() - eback());
    }

    void SetPosition(size_t Offset)
    {
        setg(eback(), eback() + static_cast<std::streamsize>(Offset), egptr());
    }

protected:
    pos_type seekoff(off_type Offset, std::ios_base::seekdir Dir, std::ios_base::openmode Which) override
    {
        if (!(Which & std::ios_base::in))
        {
            return pos_type(off_type(-1));
        }
        off_type Base = 0;
        if (Dir == std::ios_base::cur)
        {
            Base = static_cast<off_type>(Position());
        }
        else if (Dir == std::ios_base::end)
        {
            Base = static_cast<off_type>(Size());
        }
        const off_type Target = Base + Offset;
        if (Target < 0 || Target > static_cast<off_type>(Size()))
        {
            return pos_type(off_type(-1));
        }
        SetPosition(static_cast<size_t>(Target));
        return pos_type(Target);
    }

    pos_type seekpos(pos_type Position, std::ios_base::openmode Which) override
    {
        return seekoff(off_type(Position), std::ios_base::beg, Which);
    }
};
} // namespace

struct BinarySerializer::State
{
    explicit State(std::vector<uint8_t>& Output)
        : WriteBuffer(std::make_unique<VectorWriteStreambuf>(Output))
        , OutStream(std::make_unique<std::ostream>(WriteBuffer.get()))
        , Output(std::make_unique<cereal::BinaryOutputArchive>(*OutStream))
    {
    }

    explicit State(std::span<const uint8_t> Input)
        : ReadBuffer(std::make_unique<MemoryReadStreambuf>(Input.data(), Input.size()))
        , InStream(std::make_unique<std::istream>(ReadBuffer.get()))
        , Input(std::make_unique<cereal::BinaryInputArchive>(*InStream))
    {
    }

    bool IsReading() const
    {
        return Input != nullptr;
    }

    std::unique_ptr<VectorWriteStreambuf> WriteBuffer;
    std::unique_ptr<std::ostream> OutStream;
    std::unique_ptr<cereal::BinaryOutputArchive> Output;

    std::unique_ptr<MemoryReadStreambuf> ReadBuffer;
    std::unique_ptr<std::istream> InStream;
    std::unique_ptr<cereal::BinaryInputArchive> Input;
};

BinarySerializer::BinarySerializer(std::vector<uint8_t>& Output, uint16_t InVersion)
    : m_state(std::make_unique<State>(Output))
    , m_version(InVersion)
{
}

BinarySerializer::BinarySerializer(std::span<const uint8_t> Input, uint16_t InVersion)
    : m_state(std::make_unique<State>(Input))
    , m_version(InVersion)
{
}

BinarySerializer::~BinarySerializer() = default;

bool BinarySerializer::IsReading() const
{
    return m_state->IsReading();
}

uint16_t BinarySerializer::Version() const
{
    return m_version;
}

template<typename T>
void BinarySerializer::SerializePrimitive(T& Value)
{
    if (!m_state->IsReading())
    {
        (*m_state->Output)(Value);
        return;
    }
    if (Remaining() < sizeof(T))
    {
        throw SerializationException(EErrorCode::DeserializationFailed,
            "Unexpected end of data at offset " + std::to_string(Position()) + " reading " + std::to_string(sizeof(T)) + " bytes");
    }
    try
    {
        (*m_state->Input)(Value);
    }
    catch (const cereal::Exception& Ex)
    {
        throw SerializationException(EErrorCode::DeserializationFailed, Ex.what());
    }
}

void BinarySerializer::Serialize(bool& Value)
{
    uint8_t Raw = Value ? 1 : 0;
    SerializePrimitive(Raw);
    if (IsReading())
    {
        if (Raw > 1)
        {
            throw SerializationException(EErrorCode::DeserializationFailed, "Invalid bool byte " + std::to_string(Raw));
        }
        Value = Raw != 0;
    }
}

void BinarySerializer::Serialize(char& Value)
{
    SerializePrimitive(Value);
}

void BinarySerializer::Serialize(int8_t& Value)
{
    SerializePrimitive(Value);
}

void BinarySerializer::Serialize(uint8_t& Value)
{
    SerializePrimitive(Value);
}

void BinarySerializer::Serialize(int16_t& Value)
{
    SerializePrimitive(Value);
}

void BinarySerializer::Serialize(uint16_t& Value)
{
    SerializePrimitive(Value);
}

void BinarySerializer::Serialize(int32_t& Value)
{
    SerializePrimitive(Value);
}

void BinarySerializer::Serialize(uint32_t& Value)
{
    SerializePrimitive(Value);
}

void BinarySerializer::Serialize(int64_t& Value)
{
    SerializePrimitive(Value);
}

void BinarySerializer::Serialize(uint64_t& Value)
{
    SerializePrimitive(Value);
}

void BinarySerializer::Serialize(float& Value)
{
    SerializePrimitive(Value);
}

void BinarySerializer::Serialize(double& Value)
{
    SerializePrimitive(Value);
}

void BinarySerializer::Serialize(std::string& Value)
{
    uint64_t Length = Value.size();
    SerializeCompressed(Length);
    if (!IsReading())
    {
        (*m_state->Output)(cereal::binary_data(Value.data(), Value.size()));
        return;
    }
    CheckReadableCount(Length);
    Value.resize(static_cast<size_t>(Length));
    if (Length > 0)
    {
        (*m_state->Input)(cereal::binary_data(Value.data(), Value.size()));
    }
}

void BinarySerializer::Serialize(Uuid& Value)
{
    SerializePrimitive(Value);
}

void BinarySerializer::Serialize(std::vector<uint8_t>& Value)
{
    uint64_t Length = Value.size();
    SerializeCompressed(Length);
    if (!IsReading())
    {
        WriteRaw(Value);
        return;
    }
    Value = ReadRaw(static_cast<size_t>(Length));
}

void BinarySerializer::SerializeCompressed(uint64_t& Value)
{
    if (!IsReading())
    {
        uint64_t Remainder = Value;
        do
        {
            uint8_t Byte = static_cast<uint8_t>(Remainder & 0x7Fu);
            Remainder >>= 7;
            if (Remainder != 0)
            {
                Byte |= 0x80u;
            }
            (*m_state->Output)(Byte);
        } while (Remainder != 0);
        return;
    }

    uint64_t Result = 0;
    for (size_t Index = 0; Index < kMaxVarIntBytes; ++Index)
    {
        uint8_t Byte = 0;
        SerializePrimitive(Byte);
        if (Index == kMaxVarIntBytes - 1 && Byte > 0x01u)
        {
            throw SerializationException(EErrorCode::DeserializationFailed, "Varint overflows 64 bits");
        }
        Result |= static_cast<uint64_t>(Byte & 0x7Fu) << (7 * Index);
        if ((Byte & 0x80u) == 0)
        {
            Value = Result;
            return;
        }
    }
    throw SerializationException(EErrorCode::DeserializationFailed, "Varint longer than 10 bytes");
}

void BinarySerializer::SerializeCompressed(int64_t& Value)
{
    uint64_t Encoded = ZigZagEncode(Value);
    SerializeCompressed(Encoded);
    if (IsReading())
    {
        Value = ZigZagDecode(Encoded);
    }
}

size_t BinarySerializer::Position() const
{
    return IsReading() ? m_state->ReadBuffer->Position() : m_state->WriteBuffer->Buffer().size();
}

void BinarySerializer::Seek(size_t Offset)
{
    if (!IsReading())
    {
        throw SerializationException(EErrorCode::InvalidArgument, "Seek is only supported when reading");
    }
    if (Offset > m_state->ReadBuffer->Size())
    {
        throw SerializationException(EErrorCode::OutOfRange,
            "Seek to " + std::to_string(Offset) + " past end of " + std::to_string(m_state->ReadBuffer->Size()) + " bytes");
    }
    m_state->ReadBuffer->SetPosition(Offset);
}

size_t BinarySerializer::Size() const
{
    return IsReading() ? m_state->ReadBuffer->Size() : m_state->WriteBuffer->Buffer().size();
}

size_t BinarySerializer::Remaining() const
{
    return IsReading() ? m_state->ReadBuffer->Size() - m_state->ReadBuffer->Position() : 0;
}

void BinarySerializer::WriteRaw(std::span<const uint8_t> Bytes)
{
    if (IsReading())
    {
        throw SerializationException(EErrorCode::InvalidArgument, "WriteRaw called on a reader");
    }
    if (!Bytes.empty())
    {
        (*m_state->Output)(cereal::binary_data(Bytes.data(), Bytes.size()));
    }
}

std::vector<uint8_t> BinarySerializer::ReadRaw(size_t Count)
{
    if (!IsReading())
    {
        throw SerializationException(EErrorCode::InvalidArgument, "ReadRaw called on a writer");
    }
    CheckReadableCount(Count);
    std::vector<uint8_t> Bytes(Count);
    if (Count > 0)
    {
        (*m_state->Input)(cereal::binary_data(Bytes.data(), Bytes.size()));
    }
    return Bytes;
}

void BinarySerializer::CheckReadableCount(uint64_t Count) const
{
    if (Count > Remaining())
    {
        throw SerializationException(EErrorCode::DeserializationFailed,
            "Length " + std::to_string(Count) + " exceeds the " + std::to_string(Remaining()) + " remaining bytes");
    }
}

} // namespace SnAPI::StateSync
