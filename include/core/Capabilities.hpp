#pragma once
/** @file  Capabilities.hpp
 *  @brief Abstract external capabilities the campaign core calls into.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>
#include <utility>

// pledge headers
#include "core/Types.hpp"

namespace pledge::core {

  /** Outcome of one value transfer. */
  struct TransferResult {
    bool ok{ true };
    std::string reason{};

    static TransferResult success() { return {}; }
    static TransferResult failure(std::string why) { return { false, std::move(why) }; }
  };

  /**
 * @class TransferCapability
 * @brief Moves value out of escrow to one identity.
 *
 *  * May fail for reasons outside our control (recipient rejects, backend down).
 *  * Implementations report failure through the result; throwing is tolerated and
 *    treated the same way by SettlementEngine.
 */
  class TransferCapability {
  public:
    virtual ~TransferCapability() = default;

    virtual TransferResult transfer(const Identity& to, Amount amount) = 0;
  };

  /**
 * @class CredentialIssuer
 * @brief Mints one globally-unique, sequentially-numbered credential per call.
 *
 *  * Failure is signalled by throwing; the calling contribution is aborted.
 */
  class CredentialIssuer {
  public:
    virtual ~CredentialIssuer() = default;

    virtual CredentialId issue(const Identity& owner) = 0;
  };

} // namespace pledge::core
