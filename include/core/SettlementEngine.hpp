#pragma once
/** @file  SettlementEngine.hpp
 *  @brief Exactly-once value movement out of escrow, fault-isolated per contributor.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <string>
#include <vector>

// pledge headers
#include "core/Capabilities.hpp"
#include "core/ContributionLedger.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Types.hpp"

namespace pledge {
  namespace core {

    struct Payout {
      Identity to;
      Amount amount{ 0 };
    };

    struct TransferFailure {
      Identity to;
      Amount amount{ 0 }; ///< attempted amount, already settled out of the ledger
      std::string reason;
    };

    /** Outcome of one batch: who got paid and who could not be paid. */
    struct SettlementReport {
      std::vector<Payout> delivered;
      std::vector<TransferFailure> failed;

      Amount deliveredTotal() const;
      Amount failedTotal() const;
      bool clean() const { return failed.empty(); }

      /// One-line rendering used in the Closed event.
      std::string summary() const;
    };

    /**
 * @class SettlementEngine
 * @brief Performs refunds and the owner withdrawal against a ContributionLedger.
 *
 *  * Every payout settles (zeroes) the ledger entry *before* calling the transfer
 *    capability, so a re-entrant call observes a zero balance.
 *  * Batch: a failed transfer is recorded in the report and the batch continues.
 *  * Single recipient: a failed transfer is raised as TransferError, state restored.
 *  * Every failed transfer is forwarded to the ErrorMonitor, tagged with the campaign id.
 *  * A transfer capability that throws counts as a failed transfer.
 */
    class SettlementEngine {
    public:
      SettlementEngine(CampaignId campaign, std::shared_ptr<ErrorMonitor> errMonitor);
      ~SettlementEngine() = default;

      //---public APIs------------------------------------------------------
      SettlementReport distributeAll(ContributionLedger& ledger, TransferCapability& transfer);

      /// @returns amount refunded; 0 (no transfer) if the balance is already settled.
      Amount refundOne(ContributionLedger& ledger, const Identity& contributor,
                       TransferCapability& transfer);

      /// Single transfer to \p owner; throws TransferError on failure.
      Amount withdrawToOwner(const Identity& owner, Amount amount, TransferCapability& transfer);

      /// Re-attempt the failed entries of an earlier batch.
      SettlementReport retry(const std::vector<TransferFailure>& failures,
                             TransferCapability& transfer);

    private:
      TransferResult attempt(const Identity& to, Amount amount, TransferCapability& transfer);
      void reportFailure(const char* what, const Identity& to, Amount amount,
                         const std::string& reason);

      const CampaignId campaign_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
    };

  } // namespace core
} // namespace pledge
