/**
 * @file SignalFeatureVector.cpp
 * @brief SignalFeatureVector implementation.
 */

#include "injsense/features/SignalFeatureVector.hpp"

#include <algorithm>

namespace injsense::features {

void SignalFeatureVector::append(std::string name, core::f64 value)
{
    _names.push_back(std::move(name));
    _values.push_back(value);
}

std::optional<core::f64> SignalFeatureVector::value(std::string_view name) const
{
    const auto it = std::find(_names.begin(), _names.end(), name);
    if (it == _names.end())
        return std::nullopt;
    return _values[static_cast<core::usize>(it - _names.begin())];
}

} // namespace injsense::features
