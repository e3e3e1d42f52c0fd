#pragma once
#include <chrono>
#include <optional>

namespace medusa::ttl {

    // ---- clocks & common types -------------------------------------------------

    using Clock = std::chrono::steady_clock;    // monotonic
    using TimePt = Clock::time_point;
    using Ms = std::chrono::milliseconds;

    // Reported by remaining_seconds() for a key that is present but expired
    constexpr long long TTL_EXPIRED = -1;

    // Longer TTLs are clamped so the nanosecond time_point cannot overflow
    constexpr long long MAX_TTL_SECONDS = 100LL * 365 * 24 * 3600;

    // Now (monotonic)
    inline TimePt now() { return Clock::now(); }

    // Build an absolute expiry from a relative duration
    inline TimePt from_seconds(long long sec, TimePt base = now()) {
        if (sec < 0) sec = 0;
        if (sec > MAX_TTL_SECONDS) sec = MAX_TTL_SECONDS;
        return base + std::chrono::seconds(sec);
    }

    // Check expiry and compute remaining
    inline bool is_expired(std::optional<TimePt> when, TimePt t = now()) {
        return when && t >= *when;
    }

    // nullopt without expiry, TTL_EXPIRED once due, otherwise whole seconds
    // rounded up so a live key never reports 0.
    inline std::optional<long long> remaining_seconds(std::optional<TimePt> when, TimePt t = now()) {
        if (!when) return std::nullopt;
        if (t >= *when) return TTL_EXPIRED;
        auto ms = std::chrono::duration_cast<Ms>(*when - t).count();
        long long secs = (ms + 999) / 1000; // ceil ms -> s
        return secs < 1 ? 1 : secs;
    }

} // namespace medusa::ttl
