/*
 * AirGap C++ - Cooperative timeout implementation
 */
#include <airgap/core/timeout.hpp>

#include <cstdio>

namespace airgap {

TimeoutContext::TimeoutContext(double timeout_seconds)
    : timeout_seconds_(timeout_seconds)
    , start_(Clock::now())
    , expired_(false) {
    deadline_ = start_ + std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(timeout_seconds > 0.0 ? timeout_seconds : 0.0));
}

void TimeoutContext::check() {
    if (expired_) {
        throw TimeoutExpired("operation timed out");
    }
    if (Clock::now() >= deadline_) {
        expired_ = true;
        char msg[64];
        snprintf(msg, sizeof(msg), "operation timed out after %.2fs", elapsed());
        throw TimeoutExpired(msg);
    }
}

bool TimeoutContext::is_expired() {
    if (!expired_ && Clock::now() >= deadline_) {
        expired_ = true;
    }
    return expired_;
}

double TimeoutContext::remaining() {
    if (is_expired()) return 0.0;
    double left = std::chrono::duration<double>(deadline_ - Clock::now()).count();
    return left > 0.0 ? left : 0.0;
}

double TimeoutContext::elapsed() const {
    return std::chrono::duration<double>(Clock::now() - start_).count();
}

} // namespace airgap
