/*
 * AirGap C++ - Cooperative timeout
 *
 * Monotonic deadline tracker for long-running operations. There is no
 * preemption: callers poll check() at directory, file and line boundaries,
 * so the worst-case overrun is one unit of work between two checks.
 */
#ifndef airgap_CORE_TIMEOUT_HPP
#define airgap_CORE_TIMEOUT_HPP

#include <chrono>
#include <stdexcept>
#include <string>

namespace airgap {

class TimeoutExpired : public std::runtime_error {
public:
    explicit TimeoutExpired(const std::string& what) : std::runtime_error(what) {}
};

class TimeoutContext {
public:
    typedef std::chrono::steady_clock Clock;

    explicit TimeoutContext(double timeout_seconds);

    // Throws TimeoutExpired once the budget is spent, and on every call after
    void check();

    // Non-throwing queries. Expiry is sticky.
    bool is_expired();
    double remaining();
    double elapsed() const;

    double budget() const { return timeout_seconds_; }

private:
    double timeout_seconds_;
    Clock::time_point start_;
    Clock::time_point deadline_;
    bool expired_;
};

} // namespace airgap

#endif // airgap_CORE_TIMEOUT_HPP
