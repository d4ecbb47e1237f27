/* @file CampaignStateMachine.cpp
 * @brief one-way Active -> Closed transitions
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// pledge headers
#include "core/CampaignStateMachine.hpp"
#include "core/Errors.hpp"

using namespace pledge::core;

CampaignStateMachine::CampaignStateMachine(Amount goal, Timestamp deadline)
    : goal_(goal), deadline_(deadline) {
  if (goal_ == 0)
    throw ValidationError("[CampaignStateMachine] goal amount must be greater than zero");
}

void CampaignStateMachine::observe(Timestamp now) {
  if (status_ == Status::Active && now >= deadline_)
    transitionTo(Status::Closed, CloseReason::DeadlineExpired);
}

void CampaignStateMachine::markGoalReached() {
  transitionTo(Status::Closed, CloseReason::GoalReached);
}

void CampaignStateMachine::markOwnerClosed() {
  transitionTo(Status::Closed, CloseReason::OwnerClosed);
}

void CampaignStateMachine::transitionTo(Status next, CloseReason why) {
  if (status_ == Status::Closed)
    throw StateError(std::string("[CampaignStateMachine] campaign already closed (") +
                     toString(reason_) + "), cannot transition to " + toString(next));
  status_ = next;
  reason_ = why;
}
