#pragma once
/** @file  Campaign.hpp
 *  @brief Public API of one crowdfunding escrow campaign.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

// pledge headers
#include "core/CampaignConfig.hpp"
#include "core/CampaignStateMachine.hpp"
#include "core/Capabilities.hpp"
#include "core/ContributionLedger.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/LogEvent.hpp"
#include "core/Logger.hpp"
#include "core/SettlementEngine.hpp"
#include "core/Types.hpp"

namespace pledge {
  namespace core {

    /** External collaborators a campaign calls into; all required. */
    struct Collaborators {
      std::shared_ptr<CredentialIssuer> issuer;
      std::shared_ptr<TransferCapability> transfer;
      std::shared_ptr<Logger> logger;
      std::shared_ptr<ErrorMonitor> errorMonitor;
      TimeSource clock{ systemTime() };
    };

    /**
 * @class Campaign
 * @brief Composition root wiring ledger, state machine and settlement engine.
 *
 *  * Every public operation runs under one per-campaign (recursive) lock, so
 *    operations never interleave; a transfer that re-enters on the same thread
 *    sees already-settled balances.
 *  * Guard failures throw before any mutation (see core/Errors.hpp).
 *  * A mutating call made from inside the issuer or a payout transfer is rejected
 *    with StateError; a refund from inside a payout finds the balance settled.
 *  * `currentAmount` is the audit total and never decreases; `withdrawable` is
 *    what is still held in escrow and drops with every successful payout.
 */
    class Campaign {
    public:
      /// Deadline is `clock() + config.duration`; throws ValidationError if that overflows the clock.
      Campaign(CampaignId id, Identity owner, Amount goal, const CampaignConfig& config,
               Collaborators deps);
      ~Campaign() = default;

      //---public API-------------------------------------------------------
      void contribute(const Identity& contributor, Amount amount);
      SettlementReport close(const Identity& caller);
      Amount refund(const Identity& contributor);
      Amount withdraw(const Identity& caller);

      /// Re-attempt payouts that failed in an earlier batch; returns the new report.
      SettlementReport retryFailedTransfers();

      //---observers---------------------------------------------------------
      CampaignId id() const { return id_; }
      const Identity& owner() const { return owner_; }
      Amount goal() const { return state_.goal(); }
      Timestamp deadline() const { return state_.deadline(); }

      Status status() const;
      CloseReason closeReason() const;
      bool isActive() const;
      bool isClosed() const;
      bool isSuccessful() const;
      bool isFailed() const;

      Amount currentAmount() const;
      Amount withdrawable() const;
      Amount balanceOf(const Identity& contributor) const;
      Amount outstanding() const; ///< ledger sum, O(n)
      std::vector<Identity> contributors() const;
      std::vector<TransferFailure> undelivered() const;

      /// Credentials of committed contributions; ids minted for an aborted one are not counted.
      std::size_t credentialsIssued() const;
      std::vector<CredentialId> credentialsOf(const Identity& contributor) const;

      Campaign(const Campaign&) = delete;
      Campaign& operator=(const Campaign&) = delete;

    private:
      std::vector<CredentialId> mintCredentials(const Identity& contributor, Amount count);
      void emit(EventKind kind, const Identity& subject, Amount amount, std::string detail = {});
      Timestamp observeNow();

      const CampaignId id_;
      const Identity owner_;
      const CampaignConfig config_;
      Collaborators deps_;

      CampaignStateMachine state_;
      ContributionLedger ledger_;
      SettlementEngine engine_;

      Amount currentAmount_{ 0 };
      Amount withdrawable_{ 0 };
      bool settling_{ false }; ///< a payout batch or withdrawal is in flight
      bool minting_{ false };   ///< the issuer is being called for a contribution

      CredentialId lastCredentialId_{ 0 };
      std::size_t credentialsIssued_{ 0 };
      std::unordered_map<Identity, std::vector<CredentialId>> credentials_;

      std::vector<TransferFailure> undelivered_; ///< failed batch payouts awaiting retry

      mutable std::recursive_mutex mtx_;
    };

  } // namespace core
} // namespace pledge
