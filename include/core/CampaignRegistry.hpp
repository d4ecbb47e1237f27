#pragma once
/** @file  CampaignRegistry.hpp
 *  @brief Creates campaigns and keeps them (terminal ones included) for audit.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>

#include "core/Campaign.hpp"
#include "core/CampaignConfig.hpp"
#include "core/Types.hpp"

namespace pledge::core {

  /**
 * @class CampaignRegistry
 * @brief Factory for Campaign objects sharing one config and one set of capabilities.
 *
 *  * Holds no mutable campaign state: each Campaign serialises its own operations,
 *    so different campaigns run fully in parallel.
 *  * The registry lock only guards the id → campaign map.
 */
  class CampaignRegistry {
  public:
    using Handle = std::shared_ptr<Campaign>;

    CampaignRegistry(CampaignConfig config, Collaborators deps);

    /// Create a campaign with deadline `now + config.duration` and log `Created`.
    Handle createCampaign(const Identity& owner, Amount goal);

    /// @returns nullptr if \p id is unknown.
    Handle find(CampaignId id) const;

    /// Same as `find()` but throws `std::out_of_range` if unknown.
    Handle at(CampaignId id) const;

    std::size_t size() const;
    const CampaignConfig& config() const { return config_; }

  private:
    const CampaignConfig config_;
    const Collaborators deps_;
    CampaignId nextId_{ 1 };
    std::map<CampaignId, Handle> campaigns_;
    mutable std::mutex mtx_;
  };

} // namespace pledge::core
