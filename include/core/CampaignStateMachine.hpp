#pragma once
/** @file  CampaignStateMachine.hpp
 *  @brief Active → Closed lifecycle of one campaign plus its guard predicates.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>

// pledge headers
#include "core/Types.hpp"

namespace pledge {
  namespace core {

    enum class Status : std::uint8_t { Active, Closed };

    enum class CloseReason : std::uint8_t { None, GoalReached, DeadlineExpired, OwnerClosed, Count };
    static_assert(static_cast<std::uint8_t>(CloseReason::Count) == 4,
                  "CloseReason count changed please update toString()");

    inline const char* toString(Status s) {
      switch (s) {
      case Status::Active:
        return "Active";
      case Status::Closed:
        return "Closed";
      default:
        return "Unknown";
      }
    }

    inline const char* toString(CloseReason r) {
      switch (r) {
      case CloseReason::None:
        return "None";
      case CloseReason::GoalReached:
        return "GoalReached";
      case CloseReason::DeadlineExpired:
        return "DeadlineExpired";
      case CloseReason::OwnerClosed:
        return "OwnerClosed";
      default:
        return "Unknown";
      }
    }

    /**
 * @class CampaignStateMachine
 * @brief Owns goal, deadline and status; the only place transitions happen.
 *
 *  * Closed is terminal; every transition is one-way.
 *  * Deadline expiry is observed lazily (`observe()` at the start of each call),
 *    never pushed by a timer.
 *  * `currentAmount` lives on the Campaign and is passed into the goal predicates.
 */
    class CampaignStateMachine {

    public:
      /// Throws ValidationError if \p goal is zero.
      CampaignStateMachine(Amount goal, Timestamp deadline);

      // --- transitions ---
      /// Close as expired if \p now has reached the deadline while still Active.
      void observe(Timestamp now);
      void markGoalReached();  ///< (a) contribution crossed the goal
      void markOwnerClosed();  ///< (c) owner cancelled while Active

      // --- guards ---
      bool isActive(Timestamp now) const { return status_ == Status::Active && now < deadline_; }
      bool isClosed(Timestamp now) const { return status_ == Status::Closed || now >= deadline_; }
      bool isSuccessful(Amount current) const { return current >= goal_; }
      bool isFailed(Amount current) const { return !isSuccessful(current); }

      Status status() const { return status_; }
      CloseReason reason() const { return reason_; }
      Amount goal() const { return goal_; }
      Timestamp deadline() const { return deadline_; }

    private:
      void transitionTo(Status next, CloseReason why);

      const Amount goal_;
      const Timestamp deadline_;
      Status status_{ Status::Active };
      CloseReason reason_{ CloseReason::None };
    };

  } // namespace core
} // namespace pledge
