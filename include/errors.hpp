// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stdexcept>
#include <string>

namespace pilesim {

/// \brief Invalid configuration or price data detected at load time. Fatal before any session starts.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

/// \brief Inbound protocol message that cannot be turned into a pile operation.
class ProtocolDecodeError : public std::runtime_error {
public:
    explicit ProtocolDecodeError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace pilesim
