#pragma once
/** @file  LogEvent.hpp
 *  @brief One externally observable campaign event, rendered as a CSV line.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>

// pledge headers
#include "core/Types.hpp"

namespace pledge {
  namespace core {

    enum class EventKind : std::uint8_t { Created, Contributed, Closed, Refunded, Withdrawn };

    inline const char* toString(EventKind k) {
      switch (k) {
      case EventKind::Created:
        return "Created";
      case EventKind::Contributed:
        return "Contributed";
      case EventKind::Closed:
        return "Closed";
      case EventKind::Refunded:
        return "Refunded";
      case EventKind::Withdrawn:
        return "Withdrawn";
      default:
        return "Unknown";
      }
    }

    struct LogEvent {
      Timestamp when{};
      CampaignId campaign{ 0 };
      EventKind kind{ EventKind::Created };
      Identity subject{};  ///< contributor or owner the event is about
      Amount amount{ 0 };
      std::string detail{}; ///< free text, e.g. settlement report summary

      /// `timestamp_ms,campaign,kind,subject,amount,"detail"` + '\n'
      std::string toCsv() const;
    };

  } // namespace core
} // namespace pledge
