#pragma once
/** @file  ContributionLedger.hpp
 *  @brief Per-contributor cumulative balances plus the ordered contributor index.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <unordered_map>
#include <vector>

// pledge headers
#include "core/Types.hpp"

namespace pledge {
  namespace core {

    /**
 * @class ContributionLedger
 * @brief Pure bookkeeping: no transfers, no locking (the owning Campaign serialises).
 *
 *  * An identity enters the index on its first contribution and never leaves it.
 *  * A settled balance reads as zero; settling again returns 0.
 */
    class ContributionLedger {

    public:
      /** Totals before and after one `record()` call. */
      struct Recorded {
        Amount oldTotal{ 0 };
        Amount newTotal{ 0 };
        bool firstContribution{ false };
      };

      ContributionLedger() = default;
      ~ContributionLedger() = default;

      // --- public API ---
      /// Adds \p amount to \p contributor; throws ValidationError on overflow.
      Recorded record(const Identity& contributor, Amount amount);

      /// Undo the `record()` that returned \p rec (must be the latest one for \p contributor).
      void revert(const Identity& contributor, const Recorded& rec);

      /// Returns the balance and zeroes it.
      Amount settle(const Identity& contributor);

      /// Put back a balance taken by `settle()` whose transfer failed.
      void restore(const Identity& contributor, Amount amount);

      Amount balanceOf(const Identity& contributor) const;

      /// Sum of all balances; O(n), diagnostics and tests only.
      Amount totalOutstanding() const;

      const std::vector<Identity>& contributors() const { return index_; }

    private:
      std::unordered_map<Identity, Amount> balances_;
      std::vector<Identity> index_; ///< insertion-ordered, distinct
    };

  } // namespace core
} // namespace pledge
