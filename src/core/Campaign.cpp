/* @file Campaign.cpp
 * @brief contribute / close / refund / withdraw under the per-campaign lock
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

// pledge headers
#include "core/Campaign.hpp"
#include "core/Errors.hpp"

using namespace pledge::core;

namespace {

  Collaborators checked(Collaborators deps) {
    if (!deps.issuer)
      throw std::invalid_argument("[Campaign] credential issuer is nullptr");
    if (!deps.transfer)
      throw std::invalid_argument("[Campaign] transfer capability is nullptr");
    if (!deps.logger)
      throw std::invalid_argument("[Campaign] logger is nullptr");
    if (!deps.errorMonitor)
      throw std::invalid_argument("[Campaign] error monitor is nullptr");
    if (!deps.clock)
      throw std::invalid_argument("[Campaign] clock is empty");
    return deps;
  }

  /// Deadline `now + duration`; the sum must fit the clock's nanosecond range.
  Timestamp deadlineAfter(Timestamp now, std::chrono::seconds duration) {
    if (duration.count() <= 0)
      throw ValidationError("[Campaign] duration must be positive");
    if (duration > std::chrono::duration_cast<std::chrono::seconds>(Timestamp::max() - now))
      throw ValidationError("[Campaign] duration of " + std::to_string(duration.count()) +
                            "s overflows the clock");
    return now + duration;
  }

  /// Raises a busy flag (payout or issuance in flight) for the lifetime of the scope.
  class FlagScope {
  public:
    explicit FlagScope(bool& flag) : flag_(flag) { flag_ = true; }
    ~FlagScope() { flag_ = false; }

    FlagScope(const FlagScope&) = delete;
    FlagScope& operator=(const FlagScope&) = delete;

  private:
    bool& flag_;
  };

} // namespace

Campaign::Campaign(CampaignId id, Identity owner, Amount goal, const CampaignConfig& config,
                   Collaborators deps)
    : id_(id), owner_(std::move(owner)), config_(config), deps_(checked(std::move(deps))),
      state_(goal, deadlineAfter(deps_.clock(), config.duration)), engine_(id_, deps_.errorMonitor) {
  if (owner_.empty())
    throw ValidationError("[Campaign] owner identity must not be empty");
  if (config_.credentialUnit == 0)
    throw ValidationError("[Campaign] credential unit must be greater than zero");
}

void Campaign::contribute(const Identity& contributor, Amount amount) {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  if (minting_)
    throw StateError("[Campaign] contribute rejected: credential issuance is in progress");
  const auto now = observeNow();

  if (!state_.isActive(now))
    throw StateError(std::string("[Campaign] contribute requires an active campaign (closed: ") +
                     toString(state_.reason()) + ")");
  if (contributor.empty())
    throw ValidationError("[Campaign] contributor identity must not be empty");
  if (amount < config_.minContribution)
    throw ValidationError("[Campaign] contribution of " + std::to_string(amount) +
                          " is below the minimum of " + std::to_string(config_.minContribution));
  if (amount > std::numeric_limits<Amount>::max() - currentAmount_)
    throw ValidationError("[Campaign] contribution overflows the campaign total");

  const auto rec = ledger_.record(contributor, amount);
  const Amount count =
      rec.newTotal / config_.credentialUnit - rec.oldTotal / config_.credentialUnit;

  std::vector<CredentialId> minted;
  try {
    FlagScope scope(minting_);
    minted = mintCredentials(contributor, count);
  } catch (const IssuanceError&) {
    ledger_.revert(contributor, rec);
    throw;
  }

  // only credentials of a committed contribution count as issued
  if (!minted.empty()) {
    lastCredentialId_ = minted.back();
    credentialsIssued_ += minted.size();
  }
  auto& held = credentials_[contributor];
  held.insert(held.end(), minted.begin(), minted.end());

  currentAmount_ += amount;
  withdrawable_ += amount;
  if (state_.status() == Status::Active && state_.isSuccessful(currentAmount_))
    state_.markGoalReached();

  emit(EventKind::Contributed, contributor, amount,
       "credentials=" + std::to_string(minted.size()));
}

SettlementReport Campaign::close(const Identity& caller) {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  const auto now = observeNow();

  if (caller != owner_)
    throw PermissionError("[Campaign] close is restricted to the owner, caller was " + caller);
  if (settling_ || minting_)
    throw StateError("[Campaign] close rejected: a settlement or issuance is in progress");
  if (!state_.isActive(now))
    throw StateError(std::string("[Campaign] close requires an active campaign (closed: ") +
                     toString(state_.reason()) + ")");

  state_.markOwnerClosed();

  SettlementReport report;
  {
    FlagScope scope(settling_);
    report = engine_.distributeAll(ledger_, *deps_.transfer);
  }

  // failed entries are settled out of the ledger but still owed
  withdrawable_ -= report.deliveredTotal() + report.failedTotal();
  undelivered_.insert(undelivered_.end(), report.failed.begin(), report.failed.end());

  emit(EventKind::Closed, owner_, report.deliveredTotal(), report.summary());
  return report;
}

Amount Campaign::refund(const Identity& contributor) {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  if (minting_)
    throw StateError("[Campaign] refund rejected: credential issuance is in progress");
  const auto now = observeNow();

  if (!state_.isClosed(now))
    throw StateError("[Campaign] refund requires a closed campaign");
  if (!state_.isFailed(currentAmount_))
    throw StateError("[Campaign] refund requires a failed campaign, goal of " +
                     std::to_string(state_.goal()) + " was reached");

  const Amount refunded = engine_.refundOne(ledger_, contributor, *deps_.transfer);
  if (refunded > 0) {
    withdrawable_ -= refunded;
    emit(EventKind::Refunded, contributor, refunded);
  }
  return refunded;
}

Amount Campaign::withdraw(const Identity& caller) {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  const auto now = observeNow();

  if (caller != owner_)
    throw PermissionError("[Campaign] withdraw is restricted to the owner, caller was " + caller);
  if (!state_.isClosed(now))
    throw StateError("[Campaign] withdraw requires a closed campaign");
  if (!state_.isSuccessful(currentAmount_))
    throw StateError("[Campaign] withdraw requires the goal of " + std::to_string(state_.goal()) +
                     " to be reached, raised " + std::to_string(currentAmount_));
  if (settling_ || minting_)
    throw StateError("[Campaign] withdraw rejected: a settlement or issuance is in progress");
  if (withdrawable_ == 0)
    throw StateError("[Campaign] nothing left to withdraw");

  Amount withdrawn = 0;
  {
    FlagScope scope(settling_);
    withdrawn = engine_.withdrawToOwner(owner_, withdrawable_, *deps_.transfer);
  }
  withdrawable_ -= withdrawn;

  emit(EventKind::Withdrawn, owner_, withdrawn);
  return withdrawn;
}

SettlementReport Campaign::retryFailedTransfers() {
  std::lock_guard<std::recursive_mutex> lock(mtx_);

  if (settling_ || minting_)
    throw StateError("[Campaign] retry rejected: a settlement or issuance is in progress");
  if (undelivered_.empty())
    return {};

  // take the pending list first so a re-entrant retry finds nothing to pay
  auto pending = std::exchange(undelivered_, {});
  SettlementReport report;
  {
    FlagScope scope(settling_);
    report = engine_.retry(pending, *deps_.transfer);
  }
  undelivered_.insert(undelivered_.end(), report.failed.begin(), report.failed.end());

  for (const auto& p : report.delivered)
    emit(EventKind::Refunded, p.to, p.amount, "retry");
  return report;
}

Status Campaign::status() const {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  return state_.isClosed(deps_.clock()) ? Status::Closed : Status::Active;
}

CloseReason Campaign::closeReason() const {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  if (state_.status() == Status::Active && state_.isClosed(deps_.clock()))
    return CloseReason::DeadlineExpired;
  return state_.reason();
}

bool Campaign::isActive() const {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  return state_.isActive(deps_.clock());
}

bool Campaign::isClosed() const {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  return state_.isClosed(deps_.clock());
}

bool Campaign::isSuccessful() const {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  return state_.isSuccessful(currentAmount_);
}

bool Campaign::isFailed() const {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  return state_.isFailed(currentAmount_);
}

Amount Campaign::currentAmount() const {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  return currentAmount_;
}

Amount Campaign::withdrawable() const {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  return withdrawable_;
}

Amount Campaign::balanceOf(const Identity& contributor) const {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  return ledger_.balanceOf(contributor);
}

Amount Campaign::outstanding() const {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  return ledger_.totalOutstanding();
}

std::vector<Identity> Campaign::contributors() const {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  return ledger_.contributors();
}

std::vector<TransferFailure> Campaign::undelivered() const {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  return undelivered_;
}

std::size_t Campaign::credentialsIssued() const {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  return credentialsIssued_;
}

std::vector<CredentialId> Campaign::credentialsOf(const Identity& contributor) const {
  std::lock_guard<std::recursive_mutex> lock(mtx_);
  auto it = credentials_.find(contributor);
  return it == credentials_.end() ? std::vector<CredentialId>{} : it->second;
}

std::vector<CredentialId> Campaign::mintCredentials(const Identity& contributor, Amount count) {
  std::vector<CredentialId> minted;
  bool seen = credentialsIssued_ > 0;
  CredentialId last = lastCredentialId_;
  for (Amount i = 0; i < count; ++i) {
    CredentialId id = 0;
    try {
      id = deps_.issuer->issue(contributor);
    } catch (const std::exception& e) {
      throw IssuanceError("[Campaign] credential issuance for " + contributor +
                          " failed: " + e.what());
    } catch (...) {
      throw IssuanceError("[Campaign] credential issuance for " + contributor +
                          " failed: non-standard exception from issuer");
    }
    // ids are global and strictly increasing; anything else is a broken issuer
    if (seen && id <= last)
      throw IssuanceError("[Campaign] issuer returned non-increasing credential id " +
                          std::to_string(id) + " after " + std::to_string(last));
    seen = true;
    last = id;
    minted.push_back(id);
  }
  return minted;
}

void Campaign::emit(EventKind kind, const Identity& subject, Amount amount, std::string detail) {
  deps_.logger->log(LogEvent{ deps_.clock(), id_, kind, subject, amount, std::move(detail) });
}

Timestamp Campaign::observeNow() {
  const auto now = deps_.clock();
  state_.observe(now);
  return now;
}
