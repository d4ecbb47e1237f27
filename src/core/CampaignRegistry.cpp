/* @file CampaignRegistry.cpp
 * @brief campaign factory + creation log
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <utility>

// pledge headers
#include "core/CampaignRegistry.hpp"
#include "core/LogEvent.hpp"

using namespace pledge::core;

CampaignRegistry::CampaignRegistry(CampaignConfig config, Collaborators deps)
    : config_(std::move(config)), deps_(std::move(deps)) {
  if (!deps_.logger)
    throw std::invalid_argument("[CampaignRegistry] logger is nullptr");
  if (!deps_.clock)
    throw std::invalid_argument("[CampaignRegistry] clock is empty");
}

CampaignRegistry::Handle CampaignRegistry::createCampaign(const Identity& owner, Amount goal) {
  std::lock_guard<std::mutex> lock(mtx_);

  const CampaignId id = nextId_;
  auto campaign = std::make_shared<Campaign>(id, owner, goal, config_, deps_);
  campaigns_.emplace(id, campaign);
  ++nextId_;

  deps_.logger->log(LogEvent{ deps_.clock(), id, EventKind::Created, owner, goal,
                              "deadline_ms=" + std::to_string(toMillis(campaign->deadline())) });
  return campaign;
}

CampaignRegistry::Handle CampaignRegistry::find(CampaignId id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = campaigns_.find(id);
  return it == campaigns_.end() ? nullptr : it->second;
}

CampaignRegistry::Handle CampaignRegistry::at(CampaignId id) const {
  auto campaign = find(id);
  if (!campaign)
    throw std::out_of_range("[CampaignRegistry] unknown campaign " + std::to_string(id));
  return campaign;
}

std::size_t CampaignRegistry::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return campaigns_.size();
}
