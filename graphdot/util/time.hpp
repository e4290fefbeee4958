/*
 * Copyright 2019 Nico Reißmann <nico.reissmann@gmail.com>
 * Copyright 2024 Håvard Krogstie <krogstie.havard@gmail.com>
 * See COPYING for terms of redistribution.
 */

#ifndef GRAPHDOT_UTIL_TIME_HPP
#define GRAPHDOT_UTIL_TIME_HPP

#include <graphdot/util/common.hpp>

#include <chrono>
#include <cstddef>

namespace graphdot::util
{

/**
 * Accumulating wall clock stopwatch. Rendering a graph is usually done in a single start/stop
 * interval, but the timer can be paused and resumed any number of times.
 */
class Timer final
{
  using Clock = std::chrono::steady_clock;

public:
  Timer() noexcept
      : Elapsed_(Clock::duration::zero()),
        IsRunning_(false)
  {}

  Timer(const Timer & other) = delete;

  Timer(Timer && other) = default;

  Timer &
  operator=(const Timer & other) = delete;

  Timer &
  operator=(Timer && other) = default;

  [[nodiscard]] bool
  IsRunning() const noexcept
  {
    return IsRunning_;
  }

  /**
   * Starts or resumes the timer. A no-op if the timer is already running.
   */
  void
  start() noexcept
  {
    if (IsRunning_)
      return;

    Start_ = Clock::now();
    IsRunning_ = true;
  }

  /**
   * Pauses the timer, adding the time since the last start() to the total.
   * A no-op if the timer is not running.
   */
  void
  stop() noexcept
  {
    if (!IsRunning_)
      return;

    Elapsed_ += Clock::now() - Start_;
    IsRunning_ = false;
  }

  /**
   * Stops the timer and discards the accumulated time.
   */
  void
  reset() noexcept
  {
    Elapsed_ = Clock::duration::zero();
    IsRunning_ = false;
  }

  /**
   * @return the accumulated time in nanoseconds. The timer must be stopped.
   */
  [[nodiscard]] size_t
  ns() const
  {
    GRAPHDOT_ASSERT(!IsRunning_);
    return static_cast<size_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Elapsed_).count());
  }

private:
  Clock::duration Elapsed_;
  bool IsRunning_;
  Clock::time_point Start_;
};

}

#endif
