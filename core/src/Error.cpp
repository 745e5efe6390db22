/**
 * @file Error.cpp
 * @brief Implementation of Error::format().
 *
 * @author InjSense Team
 * @version 0.1.0
 * @date 2026-10-16
 * @copyright MIT License
 */
#include "injsense/core/Error.hpp"

#include <sstream>

namespace injsense::core {

std::string Error::format() const
{
    std::ostringstream os;
    os << '[' << errorCodeName(_code) << "] " << _message
       << " (" << _location.file_name() << ':' << _location.line() << ')';
    return os.str();
}

} // namespace injsense::core
