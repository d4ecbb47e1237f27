#pragma once
/** @file  Types.hpp
 *  @brief Vocabulary types shared by every pledge module.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace pledge {
  namespace core {

    using Identity = std::string;     ///< account / address of a party
    using Amount = std::uint64_t;     ///< smallest indivisible value unit
    using CredentialId = std::uint64_t;
    using CampaignId = std::uint64_t;

    using Clock = std::chrono::system_clock;
    using Timestamp = Clock::time_point;

    /// Source of "now"; injected so tests can drive the deadline.
    using TimeSource = std::function<Timestamp()>;

    inline TimeSource systemTime() {
      return [] { return Clock::now(); };
    }

    inline std::int64_t toMillis(Timestamp t) {
      return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    }

  } // namespace core
} // namespace pledge
