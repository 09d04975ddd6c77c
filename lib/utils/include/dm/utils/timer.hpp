/*
Module Name:
- timer.hpp

Abstract:
- Monotonic age tracker built on std::chrono::steady_clock.
- Used for cache freshness and cooldown bookkeeping where wall clock jumps
  must not make an entry look younger or older than it is.
- A default constructed Timer is "never started" and reports itself as older
  than any finite age.
*/
#pragma once

// C++ standard library
#include <chrono>
#include <concepts>
#include <type_traits>

// GSL
#include <gsl/gsl>

namespace dm
{

    // D must be a std::chrono::duration (cv/ref-qualified types are accepted)
    template<class D>
    concept ChronoDuration = requires {
        typename std::remove_cvref_t<D>::rep;
        typename std::remove_cvref_t<D>::period;
    } && std::same_as<std::remove_cvref_t<D>, std::chrono::duration<typename std::remove_cvref_t<D>::rep, typename std::remove_cvref_t<D>::period>>;

    class Timer
    {
    public:
        using clock = std::chrono::steady_clock;
        static_assert(clock::is_steady, "Timer requires a steady clock");

        Timer() noexcept = default;

        // Start (or restart) measuring from now.
        void reset() noexcept
        {
            start_ = clock::now();
            started_ = true;
        }

        // Forget the start point; is_older_than() is true afterwards.
        void clear() noexcept
        {
            started_ = false;
        }

        [[nodiscard]] auto elapsed() const noexcept -> clock::duration
        {
            if (!started_)
            {
                return clock::duration::max();
            }
            const auto d = clock::now() - start_;
            Ensures(d >= clock::duration::zero()); // relies on monotonic clock
            return d;
        }

        template<ChronoDuration D>
        [[nodiscard]] bool is_older_than(const D& age) const noexcept
        {
            if (!started_)
            {
                return true;
            }
            return elapsed() >= std::chrono::duration_cast<clock::duration>(age);
        }

    private:
        clock::time_point start_{};
        bool started_ = false;
    };

} // namespace dm
