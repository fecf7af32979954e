#pragma once
/** @file  Transport.hpp
 *  @brief Boundary transport contract: request/reply calls plus named push channels.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <functional>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace salvage {
  namespace io {

    /**
 * @class Transport
 * @brief Abstract crossing of the trust boundary.
 *
 *  * `invoke()` sends one request and blocks until its reply arrives; events
 *    received meanwhile are dispatched to listeners on the calling thread.
 *  * `addListener()` registers one raw listener; `removeListener()` removes
 *    exactly that listener and reports whether it was still registered.
 *  * Raw listeners receive the positional event arguments as a JSON array.
 *  * Implementations throw `core::TransportFailure` when a call cannot complete.
 */
    class Transport {
    public:
      using ListenerId = std::uint64_t;
      using RawListener = std::function<void(const nlohmann::json& args)>;

      virtual ~Transport() = default;

      //---public API------------------------------------------------------
      virtual nlohmann::json invoke(const std::string& channel, const nlohmann::json& payload) = 0;
      virtual ListenerId addListener(const std::string& channel, RawListener listener) = 0;
      virtual bool removeListener(const std::string& channel, ListenerId id) noexcept = 0;
    };

  } // namespace io
} // namespace salvage
