/* @file AccountBook.cpp
 * @brief in-memory transfer backend
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "io/AccountBook.hpp"

using namespace pledge::io;
using pledge::core::Amount;
using pledge::core::Identity;
using pledge::core::TransferResult;

TransferResult AccountBook::transfer(const Identity& to, Amount amount) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (rejecting_.count(to))
    return TransferResult::failure("recipient " + to + " rejects transfers");
  accounts_[to] += amount;
  ++transfers_;
  return TransferResult::success();
}

void AccountBook::setRejecting(const Identity& who, bool rejecting) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (rejecting)
    rejecting_.insert(who);
  else
    rejecting_.erase(who);
}

Amount AccountBook::balanceOf(const Identity& who) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = accounts_.find(who);
  return it == accounts_.end() ? 0 : it->second;
}

std::size_t AccountBook::transferCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return transfers_;
}
