#pragma once

#include "types.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>

namespace apimgr
{
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;
    using ClockFn = std::function<TimePoint()>;

    /** Authoritative quota state, e.g. reported by the remote service. */
    struct QuotaSnapshot
    {
        std::size_t count{0};
        TimePoint window_start{};
    };

    /**
     * Thread-safe fixed-window call quota.
     *
     * At most `threshold` calls are admitted per window. Once
     * `now - window_start >= window_duration` the next admission check starts
     * a new window (count back to 0, window_start = now).
     *
     * `admit()` / `record()` are the advisory pair. Concurrent callers should
     * use `reserve()`, which checks and takes an in-flight slot under a single
     * lock so that two callers can never both see the last free slot.
     */
    class QuotaWindow
    {
    public:
        struct Config
        {
            std::chrono::seconds window_duration{3600};
            std::chrono::seconds window_buffer{0}; // padding added to the window
            std::size_t threshold{60};
        };

        /**
         * An admitted call that has not been recorded yet. Committing records
         * the call; dropping it uncommitted gives the slot back.
         */
        class Reservation
        {
        public:
            Reservation(Reservation &&other) noexcept;
            Reservation &operator=(Reservation &&other) noexcept;
            Reservation(const Reservation &) = delete;
            Reservation &operator=(const Reservation &) = delete;
            ~Reservation();

            void commit();

        private:
            friend class QuotaWindow;
            explicit Reservation(QuotaWindow *window) : window_(window) {}

            QuotaWindow *window_;
        };

        explicit QuotaWindow(const Config &cfg, ClockFn clock = &Clock::now);

        /** True if a call may be made now. Does not change the count. */
        bool admit();

        /** Count one call against the current window. */
        void record();

        /** Admit and hold a slot atomically; nullopt when the quota is exhausted. */
        std::optional<Reservation> reserve();

        /** Overwrite the count (resync). Not clamped; window_start is kept. */
        void set_count(std::size_t count);

        /** Replace count and window start, e.g. from a start-up snapshot. */
        Result<void> restore(const QuotaSnapshot &snapshot);

        std::size_t count() const;
        std::size_t in_flight() const;
        std::size_t threshold() const { return cfg_.threshold; }
        /** Effective window length, buffer included. */
        std::chrono::seconds window_duration() const { return cfg_.window_duration + cfg_.window_buffer; }
        TimePoint window_start() const;

        std::size_t remaining_requests() const;
        std::chrono::milliseconds remaining_time() const;
        QuotaSnapshot snapshot() const;

    private:
        void roll_window(TimePoint now);
        bool elapsed(TimePoint now) const;
        void commit_reservation();
        void release_reservation();

        Config cfg_;
        ClockFn clock_;
        mutable std::mutex mutex_;
        std::size_t count_{0};
        std::size_t in_flight_{0};
        TimePoint window_start_;
    };
}
