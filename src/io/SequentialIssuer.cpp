/* @file SequentialIssuer.cpp
 * @brief in-memory credential minting
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "io/SequentialIssuer.hpp"

using namespace pledge::io;
using pledge::core::CredentialId;
using pledge::core::Identity;

CredentialId SequentialIssuer::issue(const Identity& owner) {
  std::lock_guard<std::mutex> lock(mtx_);
  const CredentialId id = next_++;
  holders_.emplace(id, owner);
  return id;
}

Identity SequentialIssuer::holderOf(CredentialId id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = holders_.find(id);
  return it == holders_.end() ? Identity{} : it->second;
}

std::size_t SequentialIssuer::issued() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return holders_.size();
}
