/* @file ScenarioRunner.cpp
 * @brief scripted campaign walk-through for pledge_sim
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

// third-party headers
#include <nlohmann/json.hpp>

// pledge headers
#include "core/Errors.hpp"
#include "core/ScenarioRunner.hpp"

using namespace pledge::core;
using nlohmann::json;

namespace {

  const char* errorKind(const CampaignError& e) {
    if (dynamic_cast<const PermissionError*>(&e))
      return "PermissionError";
    if (dynamic_cast<const StateError*>(&e))
      return "StateError";
    if (dynamic_cast<const ValidationError*>(&e))
      return "ValidationError";
    if (dynamic_cast<const TransferError*>(&e))
      return "TransferError";
    if (dynamic_cast<const IssuanceError*>(&e))
      return "IssuanceError";
    return "CampaignError";
  }

  std::string requireString(const json& s, const char* key) {
    if (!s.contains(key) || !s.at(key).is_string())
      throw std::invalid_argument(std::string("[ScenarioRunner] '") + key + "' must be a string");
    return s.at(key).get<std::string>();
  }

  std::uint64_t requireUnsigned(const json& s, const char* key) {
    if (!s.contains(key) || !s.at(key).is_number_unsigned())
      throw std::invalid_argument(std::string("[ScenarioRunner] '") + key +
                                  "' must be a non-negative integer");
    return s.at(key).get<std::uint64_t>();
  }

} // namespace

ScenarioRunner::ScenarioRunner(CampaignConfig config, std::ostream& out)
    : config_(std::move(config)), out_(out), start_(Clock::now()),
      accounts_(std::make_shared<io::AccountBook>()),
      issuer_(std::make_shared<io::SequentialIssuer>()), logger_(std::make_shared<Logger>()),
      errorMonitor_(std::make_shared<ErrorMonitor>()) {
  errorMonitor_->registerEscalation(
      [this](const std::string& msg) { out_ << "  ! escalated: " << msg << "\n"; });

  Collaborators deps;
  deps.issuer = issuer_;
  deps.transfer = accounts_;
  deps.logger = logger_;
  deps.errorMonitor = errorMonitor_;
  deps.clock = [this] { return start_ + offset_; };
  registry_ = std::make_unique<CampaignRegistry>(config_, std::move(deps));
}

ScenarioRunner::~ScenarioRunner() { logger_->finishRun(); }

int ScenarioRunner::run(const json& script) {
  if (!script.is_object())
    throw std::invalid_argument("[ScenarioRunner] script must be a JSON object");
  if (!script.contains("steps") || !script.at("steps").is_array())
    throw std::invalid_argument("[ScenarioRunner] 'steps' must be an array");

  if (script.contains("reject")) {
    for (const auto& who : script.at("reject")) {
      if (!who.is_string())
        throw std::invalid_argument("[ScenarioRunner] 'reject' entries must be strings");
      accounts_->setRejecting(who.get<std::string>(), true);
    }
  }

  if (!config_.eventLog.empty() && !logger_->running())
    logger_->startNewRun(config_.eventLog);

  auto campaign =
      registry_->createCampaign(requireString(script, "owner"), requireUnsigned(script, "goal"));
  out_ << "campaign " << campaign->id() << " owner=" << campaign->owner()
       << " goal=" << campaign->goal() << "\n";

  int failures = 0;
  int n = 0;
  for (const auto& s : script.at("steps")) {
    ++n;
    out_ << "[" << n << "] " << s.dump() << "\n";
    try {
      step(*campaign, s);
    } catch (const CampaignError& e) {
      ++failures;
      out_ << "  -> " << errorKind(e) << ": " << e.what() << "\n";
    }
  }

  summary(*campaign);
  logger_->finishRun();
  return failures;
}

void ScenarioRunner::step(Campaign& campaign, const json& s) {
  const auto op = requireString(s, "op");

  if (op == "contribute") {
    const auto who = requireString(s, "who");
    campaign.contribute(who, requireUnsigned(s, "amount"));
    out_ << "  -> ok, balance=" << campaign.balanceOf(who)
         << " credentials=" << campaign.credentialsOf(who).size()
         << " raised=" << campaign.currentAmount() << "\n";
  } else if (op == "advance") {
    offset_ += std::chrono::seconds(requireUnsigned(s, "seconds"));
    out_ << "  -> now +" << offset_.count() << "s, " << toString(campaign.status()) << "\n";
  } else if (op == "close") {
    auto report = campaign.close(requireString(s, "who"));
    out_ << "  -> closed, " << report.summary() << "\n";
  } else if (op == "refund") {
    out_ << "  -> refunded " << campaign.refund(requireString(s, "who")) << "\n";
  } else if (op == "withdraw") {
    out_ << "  -> withdrew " << campaign.withdraw(requireString(s, "who")) << "\n";
  } else if (op == "retry") {
    auto report = campaign.retryFailedTransfers();
    out_ << "  -> retried, " << report.summary() << "\n";
  } else if (op == "accept") {
    accounts_->setRejecting(requireString(s, "who"), false);
    out_ << "  -> ok\n";
  } else {
    throw std::invalid_argument("[ScenarioRunner] unknown op '" + op + "'");
  }
}

void ScenarioRunner::summary(const Campaign& campaign) {
  out_ << "final: status=" << toString(campaign.status())
       << " reason=" << toString(campaign.closeReason()) << " raised=" << campaign.currentAmount()
       << " withdrawable=" << campaign.withdrawable()
       << " undelivered=" << campaign.undelivered().size()
       << " credentials=" << campaign.credentialsIssued() << "\n";
}
