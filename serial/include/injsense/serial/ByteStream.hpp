// /////////////////////////////////////////////////////////////////////////////
/// @file ByteStream.hpp
/// @brief Byte-aligned binary serialization stream for model artifacts.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include "injsense/core/Expected.hpp"
#include "injsense/core/NonCopyable.hpp"
#include "injsense/core/Types.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace injsense::serial {

// /////////////////////////////////////////////////////////////////////////////
/// @class ByteStream
/// @brief Compact little-endian read/write stream.
///
/// Integers are stored little-endian regardless of host byte order and
/// doubles are stored as their IEEE-754 bit pattern, so artifacts written
/// on one machine reproduce bit-identical models on another.
// /////////////////////////////////////////////////////////////////////////////
class ByteStream final : public core::NonCopyable<ByteStream>
{
public:
    /// @brief Constructs an empty writable stream.
    ByteStream() noexcept;

    /// @brief Constructs a read-only stream over a copy of @p data.
    explicit ByteStream(std::span<const core::byte> data);

    ~ByteStream();

    ByteStream(ByteStream&&) noexcept = default;
    ByteStream& operator=(ByteStream&&) noexcept = default;

    // --------------------------------------------------------------------- //
    //  Write                                                                 //
    // --------------------------------------------------------------------- //

    void writeU8(core::u8 value);
    void writeU16(core::u16 value);
    void writeU32(core::u32 value);
    void writeU64(core::u64 value);
    void writeF64(core::f64 value);

    /// @brief Writes a u32 length prefix followed by the raw characters.
    void writeString(std::string_view value);

    /// @brief Writes a u32 count prefix followed by each value as f64.
    void writeF64Array(std::span<const core::f64> values);

    /// @brief Writes raw bytes without a length prefix.
    void writeBytes(std::span<const core::byte> bytes);

    // --------------------------------------------------------------------- //
    //  Read                                                                  //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::Expected<core::u8>  readU8();
    [[nodiscard]] core::Expected<core::u16> readU16();
    [[nodiscard]] core::Expected<core::u32> readU32();
    [[nodiscard]] core::Expected<core::u64> readU64();
    [[nodiscard]] core::Expected<core::f64> readF64();
    [[nodiscard]] core::Expected<std::string> readString();
    [[nodiscard]] core::Expected<std::vector<core::f64>> readF64Array();

    // --------------------------------------------------------------------- //
    //  Query                                                                 //
    // --------------------------------------------------------------------- //

    /// @brief Returns the number of bytes left to read.
    [[nodiscard]] core::usize bytesRemaining() const noexcept;

    /// @brief Returns the current read offset.
    [[nodiscard]] core::usize readOffset() const noexcept;

    /// @brief Returns the underlying byte buffer.
    [[nodiscard]] std::span<const core::byte> data() const noexcept;

    /// @brief Returns true if the stream was constructed for reading.
    [[nodiscard]] bool readOnly() const noexcept;

private:
    [[nodiscard]] core::Expected<core::u64> readLittleEndian(core::usize width);
    void writeLittleEndian(core::u64 value, core::usize width);

    std::vector<core::byte> _buffer;
    core::usize             _readPos{0};
    bool                    _readOnly{false};
};

} // namespace injsense::serial
