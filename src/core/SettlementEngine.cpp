/* @file SettlementEngine.cpp
 * @brief settle-then-transfer payouts with per-contributor fault isolation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <sstream>
#include <stdexcept>
#include <utility>

// pledge headers
#include "core/Errors.hpp"
#include "core/SettlementEngine.hpp"

using namespace pledge::core;

Amount SettlementReport::deliveredTotal() const {
  Amount sum = 0;
  for (const auto& p : delivered)
    sum += p.amount;
  return sum;
}

Amount SettlementReport::failedTotal() const {
  Amount sum = 0;
  for (const auto& f : failed)
    sum += f.amount;
  return sum;
}

std::string SettlementReport::summary() const {
  std::ostringstream os;
  os << "delivered=" << delivered.size() << '/' << deliveredTotal() << " failed=" << failed.size()
     << '/' << failedTotal();
  for (const auto& f : failed)
    os << " [" << f.to << ':' << f.amount << ' ' << f.reason << ']';
  return os.str();
}

SettlementEngine::SettlementEngine(CampaignId campaign, std::shared_ptr<ErrorMonitor> errorMonitor)
    : campaign_(campaign), errorMonitor_(std::move(errorMonitor)) {
  if (!errorMonitor_)
    throw std::invalid_argument("[SettlementEngine] error monitor is nullptr");
}

SettlementReport SettlementEngine::distributeAll(ContributionLedger& ledger,
                                                 TransferCapability& transfer) {
  SettlementReport report;

  // index by position: a re-entrant caller may append while we transfer
  for (std::size_t i = 0; i < ledger.contributors().size(); ++i) {
    const Identity who = ledger.contributors()[i];
    const Amount owed = ledger.settle(who);
    if (owed == 0)
      continue;

    auto res = attempt(who, owed, transfer);
    if (res.ok) {
      report.delivered.push_back({ who, owed });
    } else {
      reportFailure("refund", who, owed, res.reason);
      report.failed.push_back({ who, owed, res.reason });
    }
  }
  return report;
}

Amount SettlementEngine::refundOne(ContributionLedger& ledger, const Identity& contributor,
                                   TransferCapability& transfer) {
  const Amount owed = ledger.settle(contributor);
  if (owed == 0)
    return 0;

  auto res = attempt(contributor, owed, transfer);
  if (!res.ok) {
    ledger.restore(contributor, owed);
    reportFailure("refund", contributor, owed, res.reason);
    throw TransferError("[SettlementEngine] refund of " + std::to_string(owed) + " to " +
                        contributor + " failed: " + res.reason);
  }
  return owed;
}

Amount SettlementEngine::withdrawToOwner(const Identity& owner, Amount amount,
                                         TransferCapability& transfer) {
  auto res = attempt(owner, amount, transfer);
  if (!res.ok) {
    reportFailure("withdraw", owner, amount, res.reason);
    throw TransferError("[SettlementEngine] withdraw of " + std::to_string(amount) + " to " +
                        owner + " failed: " + res.reason);
  }
  return amount;
}

SettlementReport SettlementEngine::retry(const std::vector<TransferFailure>& failures,
                                         TransferCapability& transfer) {
  SettlementReport report;
  for (const auto& f : failures) {
    auto res = attempt(f.to, f.amount, transfer);
    if (res.ok) {
      report.delivered.push_back({ f.to, f.amount });
    } else {
      reportFailure("retry", f.to, f.amount, res.reason);
      report.failed.push_back({ f.to, f.amount, res.reason });
    }
  }
  return report;
}

TransferResult SettlementEngine::attempt(const Identity& to, Amount amount,
                                         TransferCapability& transfer) {
  try {
    return transfer.transfer(to, amount);
  } catch (const std::exception& e) {
    return TransferResult::failure(e.what());
  } catch (...) {
    return TransferResult::failure("non-standard exception from transfer capability");
  }
}

void SettlementEngine::reportFailure(const char* what, const Identity& to, Amount amount,
                                     const std::string& reason) {
  // campaign id keeps identical failures of different campaigns distinct in the monitor
  errorMonitor_->notifyFailure("[SettlementEngine] campaign " + std::to_string(campaign_) +
                               ": " + what + " of " + std::to_string(amount) + " to " + to +
                               " failed: " + reason);
}
