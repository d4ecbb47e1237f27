#pragma once
/** @file  SequentialIssuer.hpp
 *  @brief In-memory credential registry numbering credentials from 1.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <mutex>
#include <unordered_map>

#include "core/Capabilities.hpp"

namespace pledge {
  namespace io {

    /**
 * @class SequentialIssuer
 * @brief CredentialIssuer that records who holds which credential id.
 *
 *  * Ids are unique across every campaign sharing this issuer.
 */
    class SequentialIssuer : public core::CredentialIssuer {
    public:
      SequentialIssuer() = default;
      ~SequentialIssuer() override = default;

      core::CredentialId issue(const core::Identity& owner) override;

      /// @returns empty identity if \p id was never issued.
      core::Identity holderOf(core::CredentialId id) const;
      std::size_t issued() const;

    private:
      core::CredentialId next_{ 1 };
      std::unordered_map<core::CredentialId, core::Identity> holders_;
      mutable std::mutex mtx_;
    };

  } // namespace io
} // namespace pledge
