#include "apimgr/quota_window.hpp"
#include <algorithm>

namespace apimgr
{
    QuotaWindow::Reservation::Reservation(Reservation &&other) noexcept
        : window_(other.window_)
    {
        other.window_ = nullptr;
    }

    QuotaWindow::Reservation &QuotaWindow::Reservation::operator=(Reservation &&other) noexcept
    {
        if (this != &other)
        {
            if (window_)
                window_->release_reservation();
            window_ = other.window_;
            other.window_ = nullptr;
        }
        return *this;
    }

    QuotaWindow::Reservation::~Reservation()
    {
        if (window_)
            window_->release_reservation();
    }

    void QuotaWindow::Reservation::commit()
    {
        if (!window_)
            return;
        window_->commit_reservation();
        window_ = nullptr;
    }

    QuotaWindow::QuotaWindow(const Config &cfg, ClockFn clock)
        : cfg_(cfg), clock_(std::move(clock))
    {
        if (cfg_.window_duration.count() <= 0)
            throw ApiError::config("Window duration must be greater than 0");
        if (cfg_.window_buffer.count() < 0)
            throw ApiError::config("Window buffer must be greater than or equal to 0");
        if (cfg_.threshold == 0)
            throw ApiError::config("Threshold must be greater than 0");
        if (!clock_)
            clock_ = &Clock::now;
        window_start_ = clock_();
    }

    bool QuotaWindow::elapsed(TimePoint now) const
    {
        return now - window_start_ >= window_duration();
    }

    void QuotaWindow::roll_window(TimePoint now)
    {
        if (elapsed(now))
        {
            count_ = 0;
            window_start_ = now;
        }
    }

    bool QuotaWindow::admit()
    {
        auto now = clock_();
        std::lock_guard lock(mutex_);
        roll_window(now);
        return count_ + in_flight_ < cfg_.threshold;
    }

    void QuotaWindow::record()
    {
        std::lock_guard lock(mutex_);
        ++count_;
    }

    std::optional<QuotaWindow::Reservation> QuotaWindow::reserve()
    {
        auto now = clock_();
        std::lock_guard lock(mutex_);
        roll_window(now);
        if (count_ + in_flight_ >= cfg_.threshold)
            return std::nullopt;
        ++in_flight_;
        return Reservation(this);
    }

    void QuotaWindow::commit_reservation()
    {
        std::lock_guard lock(mutex_);
        --in_flight_;
        ++count_;
    }

    void QuotaWindow::release_reservation()
    {
        std::lock_guard lock(mutex_);
        --in_flight_;
    }

    void QuotaWindow::set_count(std::size_t count)
    {
        std::lock_guard lock(mutex_);
        count_ = count;
    }

    Result<void> QuotaWindow::restore(const QuotaSnapshot &snapshot)
    {
        auto now = clock_();
        if (snapshot.window_start > now)
        {
            return std::unexpected(ApiError::invalid_input("Window start is ahead of the current time"));
        }
        std::lock_guard lock(mutex_);
        count_ = snapshot.count;
        window_start_ = snapshot.window_start;
        return {};
    }

    std::size_t QuotaWindow::count() const
    {
        std::lock_guard lock(mutex_);
        return count_;
    }

    std::size_t QuotaWindow::in_flight() const
    {
        std::lock_guard lock(mutex_);
        return in_flight_;
    }

    TimePoint QuotaWindow::window_start() const
    {
        std::lock_guard lock(mutex_);
        return window_start_;
    }

    std::size_t QuotaWindow::remaining_requests() const
    {
        auto now = clock_();
        std::lock_guard lock(mutex_);
        std::size_t used = (elapsed(now) ? 0 : count_) + in_flight_;
        return used >= cfg_.threshold ? 0 : cfg_.threshold - used;
    }

    std::chrono::milliseconds QuotaWindow::remaining_time() const
    {
        auto now = clock_();
        std::lock_guard lock(mutex_);
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(window_start_ + window_duration() - now);
        return std::max(left, std::chrono::milliseconds::zero());
    }

    QuotaSnapshot QuotaWindow::snapshot() const
    {
        std::lock_guard lock(mutex_);
        return QuotaSnapshot{count_, window_start_};
    }

} // namespace apimgr
