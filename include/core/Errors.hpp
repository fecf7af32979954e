#pragma once
/** @file  Errors.hpp
 *  @brief Exception types raised on the command path.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <string>

namespace salvage {
  namespace core {

    /// Host replied with `success: false`.
    class CommandFailure : public std::runtime_error {
    public:
      explicit CommandFailure(const std::string& message) : std::runtime_error(message) {}
    };

    /// The boundary call itself could not complete (link closed, timeout, fault frame).
    class TransportFailure : public std::runtime_error {
    public:
      explicit TransportFailure(const std::string& message) : std::runtime_error(message) {}
    };

  } // namespace core
} // namespace salvage
