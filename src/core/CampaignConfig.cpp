/* @file CampaignConfig.cpp
 * @brief schema validation for the campaign config file
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <limits>
#include <string>
#include <stdexcept>

// third-party headers
#include <nlohmann/json.hpp>

// pledge headers
#include "core/CampaignConfig.hpp"

using namespace pledge::core;

namespace {
  constexpr std::uint64_t kMaxDurationSeconds = 100ULL * 365 * 24 * 3600; // 100 years

  std::uint64_t positive(const nlohmann::json& j, const char* key, std::uint64_t fallback,
                         std::uint64_t max = std::numeric_limits<std::uint64_t>::max()) {
    if (!j.contains(key))
      return fallback;
    const auto& v = j.at(key);
    if (!v.is_number_unsigned() || v.get<std::uint64_t>() == 0)
      throw std::invalid_argument(std::string("[CampaignConfig] '") + key +
                                  "' must be a positive integer");
    if (v.get<std::uint64_t>() > max)
      throw std::invalid_argument(std::string("[CampaignConfig] '") + key +
                                  "' must not exceed " + std::to_string(max));
    return v.get<std::uint64_t>();
  }
} // namespace

CampaignConfig CampaignConfig::fromJson(const nlohmann::json& j) {
  if (!j.is_object())
    throw std::invalid_argument("[CampaignConfig] top-level value must be an object");

  CampaignConfig cfg;
  cfg.minContribution = positive(j, "min_contribution", cfg.minContribution);
  cfg.credentialUnit = positive(j, "credential_unit", cfg.credentialUnit);
  cfg.duration = std::chrono::seconds(static_cast<std::int64_t>(
      positive(j, "duration_seconds", cfg.duration.count(), kMaxDurationSeconds)));

  if (j.contains("event_log")) {
    if (!j.at("event_log").is_string())
      throw std::invalid_argument("[CampaignConfig] 'event_log' must be a string");
    cfg.eventLog = j.at("event_log").get<std::string>();
  }
  return cfg;
}
