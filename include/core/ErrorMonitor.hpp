#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 CubeCycle contributors — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace cubecycle::core {

  /**
 * @class ErrorMonitor
 * @brief Subsystems call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique fault text.
 *
 * * Thread-safe (mutex-protected vector).
 * * `reset()` forgets what was seen, so a fault that comes back after a
 *   healthy cycle is reported again.
 */
  class ErrorMonitor {
  public:
    using Escalation = std::function<void(const std::string&)>;

    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register the sink for first-seen faults (replaces any previous one).
    void registerEscalation(Escalation cb);

    /// Called by subsystems on fault; forwards if the text is new.
    virtual void notifyFailure(const std::string& message);

    /// Clear the de-dupe list.
    virtual void reset();

    /// Total notifications received, duplicates included.
    std::size_t failureCount() const;

  private:
    void forwardIfNew(const std::string& message);

    Escalation escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    std::size_t total_{ 0 };
    mutable std::mutex mtx_;
  };

} // namespace cubecycle::core
