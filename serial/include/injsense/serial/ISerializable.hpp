/**
 * @file ISerializable.hpp
 * @brief Abstract serialization interface.
 *
 * @author InjSense Team
 * @version 0.1.0
 * @date 2026-10-16
 * @copyright MIT License
 */
#pragma once

#ifndef INJSENSE_SERIAL_ISERIALIZABLE_HPP
    #define INJSENSE_SERIAL_ISERIALIZABLE_HPP

#include "injsense/core/Expected.hpp"

namespace injsense::serial {

class ByteStream;

/** @brief Interface for types that support binary serialization. */
class ISerializable
{
public:
    virtual ~ISerializable() = default;

    /**
     * @brief Serialize this object into the stream.
     * @param stream Output stream.
     * @return Success or error.
     */
    [[nodiscard]] virtual core::ExpectedVoid serialize(ByteStream& stream) const = 0;

    /**
     * @brief Deserialize this object from the stream.
     * @param stream Input stream.
     * @return Success or error.
     */
    [[nodiscard]] virtual core::ExpectedVoid deserialize(ByteStream& stream) = 0;
};

} // namespace injsense::serial

#endif // INJSENSE_SERIAL_ISERIALIZABLE_HPP
