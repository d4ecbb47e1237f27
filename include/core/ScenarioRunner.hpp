#pragma once
/** @file  ScenarioRunner.hpp
 *  @brief Drives one campaign through a scripted JSON scenario (pledge_sim).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <ostream>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/CampaignConfig.hpp"
#include "core/CampaignRegistry.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "io/AccountBook.hpp"
#include "io/SequentialIssuer.hpp"

namespace pledge {
  namespace core {

    /**
 * @class ScenarioRunner
 * @brief Wires a registry to the in-memory adapters and a simulated clock.
 *
 * Script shape:
 * @code
 * { "owner": "olivia", "goal": 10, "reject": ["bob"],
 *   "steps": [ { "op": "contribute", "who": "alice", "amount": 6 },
 *              { "op": "advance", "seconds": 3600 },
 *              { "op": "close" | "refund" | "withdraw", "who": "..." },
 *              { "op": "retry" }, { "op": "accept", "who": "bob" } ] }
 * @endcode
 * Each step prints one line; a rejected operation is reported, not fatal.
 */
    class ScenarioRunner {

    public:
      ScenarioRunner(CampaignConfig config, std::ostream& out);
      ~ScenarioRunner();

      /// Runs every step; @returns number of steps that raised a CampaignError.
      /// Throws `std::invalid_argument` on a malformed script.
      int run(const nlohmann::json& script);

      const io::AccountBook& accounts() const { return *accounts_; }

    private:
      void step(Campaign& campaign, const nlohmann::json& s);
      void summary(const Campaign& campaign);

      CampaignConfig config_;
      std::ostream& out_;
      std::chrono::seconds offset_{ 0 }; ///< simulated time elapsed since start
      Timestamp start_;

      std::shared_ptr<io::AccountBook> accounts_;
      std::shared_ptr<io::SequentialIssuer> issuer_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::unique_ptr<CampaignRegistry> registry_;
    };

  } // namespace core
} // namespace pledge
