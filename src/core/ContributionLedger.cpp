/* @file ContributionLedger.cpp
 * @brief contributor balance bookkeeping
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <limits>
#include <string>

// pledge headers
#include "core/ContributionLedger.hpp"
#include "core/Errors.hpp"

using namespace pledge::core;

ContributionLedger::Recorded ContributionLedger::record(const Identity& contributor,
                                                        Amount amount) {
  auto it = balances_.find(contributor);
  const bool first = (it == balances_.end());
  const Amount old = first ? 0 : it->second;

  if (amount > std::numeric_limits<Amount>::max() - old)
    throw ValidationError("[ContributionLedger] contribution overflows balance of " +
                          contributor);

  if (first) {
    balances_.emplace(contributor, amount);
    index_.push_back(contributor);
  } else {
    it->second = old + amount;
  }
  return { old, old + amount, first };
}

void ContributionLedger::revert(const Identity& contributor, const Recorded& rec) {
  auto it = balances_.find(contributor);
  if (it == balances_.end() || it->second != rec.newTotal)
    throw std::logic_error("[ContributionLedger] revert does not match latest record for " +
                           contributor);

  if (rec.firstContribution) {
    balances_.erase(it);
    // the first contribution of an identity is always the last index entry
    if (!index_.empty() && index_.back() == contributor)
      index_.pop_back();
  } else {
    it->second = rec.oldTotal;
  }
}

Amount ContributionLedger::settle(const Identity& contributor) {
  auto it = balances_.find(contributor);
  if (it == balances_.end())
    return 0;
  const Amount owed = it->second;
  it->second = 0;
  return owed;
}

void ContributionLedger::restore(const Identity& contributor, Amount amount) {
  auto it = balances_.find(contributor);
  if (it == balances_.end())
    throw std::logic_error("[ContributionLedger] restore for unknown contributor " + contributor);
  it->second += amount;
}

Amount ContributionLedger::balanceOf(const Identity& contributor) const {
  auto it = balances_.find(contributor);
  return it == balances_.end() ? 0 : it->second;
}

Amount ContributionLedger::totalOutstanding() const {
  Amount sum = 0;
  for (const auto& [who, bal] : balances_)
    sum += bal;
  return sum;
}
