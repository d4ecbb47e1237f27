/* @file ErrorMonitor.cpp
 * @brief de-duplicating failure sink with a single escalation hook
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iostream>
#include <utility>

// pledge headers
#include "core/ErrorMonitor.hpp"

namespace pledge {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

    std::size_t ErrorMonitor::distinctFailures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        seen_.push_back(message);
        cb = escalation_;
      }

      // escalate outside the lock so the callback may call back in
      if (cb)
        cb(message);
      else
        std::cerr << message << "\n";
    }

  } // namespace core
} // namespace pledge
