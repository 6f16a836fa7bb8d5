/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>

// CubeCycle headers
#include "core/ErrorMonitor.hpp"

namespace cubecycle {
  namespace core {

    void ErrorMonitor::registerEscalation(Escalation cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

    void ErrorMonitor::reset() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
    }

    std::size_t ErrorMonitor::failureCount() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return total_;
    }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      Escalation cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        ++total_;
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        seen_.push_back(message);
        cb = escalation_;
      }
      // call outside the lock, the callback may log or notify again
      if (cb)
        cb(message);
    }

  } // namespace core
} // namespace cubecycle
