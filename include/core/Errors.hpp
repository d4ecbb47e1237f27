#pragma once
/** @file  Errors.hpp
 *  @brief Exception taxonomy raised by campaign operations.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

namespace pledge::core {

  /**
 * @class CampaignError
 * @brief Root of every failure a campaign operation can raise.
 *
 *  * Guard failures (permission, state, validation) are raised before any mutation.
 *  * Messages always name the violated precondition.
 */
  class CampaignError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// Wrong caller for an owner-only operation.
  class PermissionError : public CampaignError {
  public:
    using CampaignError::CampaignError;
  };

  /// Operation attempted in the wrong campaign state.
  class StateError : public CampaignError {
  public:
    using CampaignError::CampaignError;
  };

  /// Bad argument, e.g. contribution below the configured minimum.
  class ValidationError : public CampaignError {
  public:
    using CampaignError::CampaignError;
  };

  /// A single-recipient value transfer failed; state is left unchanged.
  class TransferError : public CampaignError {
  public:
    using CampaignError::CampaignError;
  };

  /// Credential issuance failed; the triggering contribution is aborted.
  class IssuanceError : public CampaignError {
  public:
    using CampaignError::CampaignError;
  };

} // namespace pledge::core
