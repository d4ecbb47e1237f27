#pragma once
/** @file  CampaignConfig.hpp
 *  @brief Tunables shared by every campaign a registry creates.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <string>

#include <nlohmann/json_fwd.hpp>

// pledge headers
#include "core/Types.hpp"

namespace pledge {
  namespace core {

    struct CampaignConfig {
      Amount minContribution{ 1 };                   ///< smallest accepted contribution
      Amount credentialUnit{ 1 };                    ///< value per issued credential
      std::chrono::seconds duration{ 30 * 24 * 3600 }; ///< creation → deadline
      std::string eventLog{};                        ///< CSV path, empty = no file

      /**
       * @brief Validate and convert a parsed config file.
       *
       * Keys: `min_contribution`, `credential_unit`, `duration_seconds`, `event_log`.
       * Missing keys keep their defaults; zero or wrongly typed values, and a
       * `duration_seconds` beyond 100 years, throw `std::invalid_argument` naming the key.
       */
      static CampaignConfig fromJson(const nlohmann::json& j);
    };

  } // namespace core
} // namespace pledge
