#pragma once
/** @file  AccountBook.hpp
 *  @brief In-memory value backend implementing TransferCapability.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

#include "core/Capabilities.hpp"

namespace pledge {
  namespace io {

    /**
 * @class AccountBook
 * @brief Credits transfers to per-identity accounts; recipients can be set to reject.
 *
 *  * Stands in for the real payment rail in pledge_sim and integration tests.
 *  * Thread-safe; shared by every campaign of a registry.
 */
    class AccountBook : public core::TransferCapability {
    public:
      AccountBook() = default;
      ~AccountBook() override = default;

      core::TransferResult transfer(const core::Identity& to, core::Amount amount) override;

      /// Make every future transfer to \p who fail (or succeed again).
      void setRejecting(const core::Identity& who, bool rejecting);

      core::Amount balanceOf(const core::Identity& who) const;
      std::size_t transferCount() const;

    private:
      std::unordered_map<core::Identity, core::Amount> accounts_;
      std::set<core::Identity> rejecting_;
      std::size_t transfers_{ 0 };
      mutable std::mutex mtx_;
    };

  } // namespace io
} // namespace pledge
