// /////////////////////////////////////////////////////////////////////////////
/// @file ByteStream.cpp
/// @brief ByteStream implementation.
// /////////////////////////////////////////////////////////////////////////////

#include "injsense/serial/ByteStream.hpp"
#include "injsense/core/Assert.hpp"

#include <bit>
#include <format>

namespace injsense::serial {

ByteStream::ByteStream() noexcept = default;

ByteStream::ByteStream(std::span<const core::byte> data)
    : _buffer{data.begin(), data.end()}
    , _readPos{0}
    , _readOnly{true}
{}

ByteStream::~ByteStream() = default;

// -------------------------------------------------------------------------- //
//  Write                                                                     //
// -------------------------------------------------------------------------- //

void ByteStream::writeLittleEndian(core::u64 value, core::usize width)
{
    INJSENSE_ASSERT(!_readOnly);

    for (core::usize i = 0; i < width; ++i)
        _buffer.push_back(static_cast<core::byte>((value >> (8 * i)) & 0xFFu));
}

void ByteStream::writeU8(core::u8 value)   { writeLittleEndian(value, 1); }
void ByteStream::writeU16(core::u16 value) { writeLittleEndian(value, 2); }
void ByteStream::writeU32(core::u32 value) { writeLittleEndian(value, 4); }
void ByteStream::writeU64(core::u64 value) { writeLittleEndian(value, 8); }

void ByteStream::writeF64(core::f64 value)
{
    writeU64(std::bit_cast<core::u64>(value));
}

void ByteStream::writeString(std::string_view value)
{
    writeU32(static_cast<core::u32>(value.size()));
    for (const char c : value)
        _buffer.push_back(static_cast<core::byte>(c));
}

void ByteStream::writeF64Array(std::span<const core::f64> values)
{
    writeU32(static_cast<core::u32>(values.size()));
    for (const core::f64 v : values)
        writeF64(v);
}

void ByteStream::writeBytes(std::span<const core::byte> bytes)
{
    INJSENSE_ASSERT(!_readOnly);
    _buffer.insert(_buffer.end(), bytes.begin(), bytes.end());
}

// -------------------------------------------------------------------------- //
//  Read                                                                      //
// -------------------------------------------------------------------------- //

core::Expected<core::u64> ByteStream::readLittleEndian(core::usize width)
{
    if (_readPos + width > _buffer.size()) {
        return core::makeError(core::ErrorCode::kCorruptedData,
            std::format("ByteStream underflow: need {} bytes at offset {}, have {}",
                        width, _readPos, _buffer.size() - _readPos));
    }

    core::u64 value = 0;
    for (core::usize i = 0; i < width; ++i)
        value |= static_cast<core::u64>(_buffer[_readPos + i]) << (8 * i);

    _readPos += width;
    return value;
}

core::Expected<core::u8> ByteStream::readU8()
{
    return readLittleEndian(1).transform([](core::u64 v) { return static_cast<core::u8>(v); });
}

core::Expected<core::u16> ByteStream::readU16()
{
    return readLittleEndian(2).transform([](core::u64 v) { return static_cast<core::u16>(v); });
}

core::Expected<core::u32> ByteStream::readU32()
{
    return readLittleEndian(4).transform([](core::u64 v) { return static_cast<core::u32>(v); });
}

core::Expected<core::u64> ByteStream::readU64()
{
    return readLittleEndian(8);
}

core::Expected<core::f64> ByteStream::readF64()
{
    return readU64().transform([](core::u64 v) { return std::bit_cast<core::f64>(v); });
}

core::Expected<std::string> ByteStream::readString()
{
    const core::u32 length = INJSENSE_TRY(readU32());

    if (length > bytesRemaining()) {
        return core::makeError(core::ErrorCode::kCorruptedData,
            std::format("string length {} exceeds remaining {} bytes", length, bytesRemaining()));
    }

    std::string out;
    out.reserve(length);
    for (core::u32 i = 0; i < length; ++i)
        out.push_back(static_cast<char>(_buffer[_readPos + i]));

    _readPos += length;
    return out;
}

core::Expected<std::vector<core::f64>> ByteStream::readF64Array()
{
    const core::u32 count = INJSENSE_TRY(readU32());

    if (static_cast<core::usize>(count) * sizeof(core::f64) > bytesRemaining()) {
        return core::makeError(core::ErrorCode::kCorruptedData,
            std::format("array of {} doubles exceeds remaining {} bytes", count, bytesRemaining()));
    }

    std::vector<core::f64> out;
    out.reserve(count);
    for (core::u32 i = 0; i < count; ++i)
        out.push_back(INJSENSE_TRY(readF64()));

    return out;
}

// -------------------------------------------------------------------------- //
//  Query                                                                     //
// -------------------------------------------------------------------------- //

core::usize ByteStream::bytesRemaining() const noexcept
{
    return _buffer.size() - _readPos;
}

core::usize ByteStream::readOffset() const noexcept { return _readPos; }

std::span<const core::byte> ByteStream::data() const noexcept { return _buffer; }

bool ByteStream::readOnly() const noexcept { return _readOnly; }

} // namespace injsense::serial
