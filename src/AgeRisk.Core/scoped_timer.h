#pragma once
#include <chrono>
#include <fmt/format.h>

namespace agerisk::core {

/// @brief Timer to printout scope execution time in milliseconds
class ScopedTimer {
  public:
    /// @brief The time measuring clock
    using ClockType = std::chrono::steady_clock;

    /// @brief Initialise a new instance of the ScopedTimer class.
    /// @param scope The scope name identification
    /// @param enabled Whether to print on destruction
    ScopedTimer(const char *scope, bool enabled = true)
        : scope_{scope}, enabled_{enabled}, start_{ClockType::now()} {}

    ScopedTimer(const ScopedTimer &) = delete;
    ScopedTimer(ScopedTimer &&) = delete;
    auto operator=(const ScopedTimer &) -> ScopedTimer & = delete;
    auto operator=(ScopedTimer &&) -> ScopedTimer & = delete;

    /// @brief Destroys the ScopedTimer instance, printout lifetime duration
    ~ScopedTimer() {
        if (enabled_) {
            fmt::print("{} ms {}\n", elapsed_ms(), scope_);
        }
    }

    /// @brief Gets the elapsed time since construction
    /// @return The elapsed time in milliseconds
    long long elapsed_ms() const {
        using namespace std::chrono;
        return duration_cast<milliseconds>(ClockType::now() - start_).count();
    }

  private:
    const char *scope_ = {};
    bool enabled_{};
    const ClockType::time_point start_ = {};
};
} // namespace agerisk::core
