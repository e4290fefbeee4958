/*
 * Copyright 2017 Nico Reißmann <nico.reissmann@gmail.com>
 * Copyright 2024 Håvard Krogstie <krogstie.havard@gmail.com>
 * See COPYING for terms of redistribution.
 */

#ifndef GRAPHDOT_UTIL_STATISTICS_HPP
#define GRAPHDOT_UTIL_STATISTICS_HPP

#include <graphdot/util/common.hpp>
#include <graphdot/util/time.hpp>

#include <cstdint>
#include <list>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace graphdot::util
{

/**
 * \brief Statistics Interface
 *
 * A statistics object records named measurements and timers about one unit of work,
 * such as rendering a single graph. The subject names what was worked on.
 */
class Statistics
{
public:
  enum class Id
  {
    DotRendering
  };

  using Measurement = std::variant<std::string, int64_t, uint64_t, double>;
  // Lists are used instead of vectors to give stable references to members
  using MeasurementList = std::list<std::pair<std::string, Measurement>>;
  using TimerList = std::list<std::pair<std::string, util::Timer>>;

  virtual ~Statistics();

  Statistics(const Statistics::Id & statisticsId, std::string subject)
      : StatisticsId_(statisticsId),
        Subject_(std::move(subject))
  {}

  [[nodiscard]] Statistics::Id
  GetId() const noexcept
  {
    return StatisticsId_;
  }

  /**
   * @return a string identifying the type of this Statistics instance
   */
  [[nodiscard]] std::string_view
  GetName() const;

  /**
   * @return the name of what was worked on while capturing these statistics
   */
  [[nodiscard]] const std::string &
  GetSubject() const noexcept
  {
    return Subject_;
  }

  /**
   * Converts the Statistics instance to a string containing all information it has.
   * Requires all timers to be stopped.
   *
   * @param fieldSeparator Separation character used between different measurements and/or timers.
   * @param nameValueSeparator Separation character used between the name and value of a measurement
   * or timer.
   *
   * @return a full serialized description of the Statistic instance
   */
  [[nodiscard]] std::string
  Serialize(char fieldSeparator, char nameValueSeparator) const;

  [[nodiscard]] bool
  HasMeasurement(const std::string & name) const noexcept;

  /**
   * Gets the measurement with the given \p name, it must exist.
   */
  [[nodiscard]] const Measurement &
  GetMeasurement(const std::string & name) const;

  /**
   * Gets the value of the measurement with the given \p name.
   * Requires the measurement to exist and have the given type \tparam T.
   */
  template<typename T>
  [[nodiscard]] const T &
  GetMeasurementValue(const std::string & name) const
  {
    const auto & measurement = GetMeasurement(name);
    return std::get<T>(measurement);
  }

  [[nodiscard]] const MeasurementList &
  GetMeasurements() const noexcept
  {
    return Measurements_;
  }

  [[nodiscard]] bool
  HasTimer(const std::string & name) const noexcept;

  /**
   * Retrieves the measured time on the timer with the given \p name.
   * Requires the timer to exist, and not currently be running.
   * @return the timer's elapsed time in nanoseconds
   */
  [[nodiscard]] size_t
  GetTimerElapsedNanoseconds(const std::string & name) const
  {
    return GetTimer(name).ns();
  }

  [[nodiscard]] const TimerList &
  GetTimers() const noexcept
  {
    return Timers_;
  }

protected:
  /**
   * Adds a measurement, identified by \p name, with the given value.
   * Requires that the measurement doesn't already exist.
   * @tparam T the type of the measurement, must be one of: std::string, int64_t, uint64_t, double
   */
  template<typename T>
  void
  AddMeasurement(std::string name, T value)
  {
    GRAPHDOT_ASSERT(!HasMeasurement(name));
    Measurements_.emplace_back(std::move(name), Measurement(std::move(value)));
  }

  /**
   * Creates a new timer with the given \p name.
   * Requires that the timer does not already exist.
   * @return a reference to the timer
   */
  util::Timer &
  AddTimer(std::string name);

  [[nodiscard]] util::Timer &
  GetTimer(const std::string & name);

  [[nodiscard]] const util::Timer &
  GetTimer(const std::string & name) const;

  /**
   * Commonly used measurement and timer labels.
   */
  struct Label
  {
    static inline const char * NumSubgraphs = "#Subgraphs";
    static inline const char * NumNodes = "#Nodes";
    static inline const char * NumEdges = "#Edges";
    static inline const char * NumBytes = "#Bytes";

    static inline const char * Timer = "Time";
  };

private:
  Statistics::Id StatisticsId_;
  std::string Subject_;

  MeasurementList Measurements_;
  TimerList Timers_;
};

/**
 * Determines which statistics a StatisticsCollector keeps.
 */
class StatisticsCollectorSettings final
{
public:
  /**
   * Creates settings for a StatisticsCollector that does not demand any statistics.
   */
  StatisticsCollectorSettings() = default;

  /**
   * Creates settings for a StatisticsCollector that demands the given statistics be collected.
   * @param demandedStatistics a set of statistics ids to collect
   */
  explicit StatisticsCollectorSettings(std::unordered_set<Statistics::Id> demandedStatistics)
      : DemandedStatistics_(std::move(demandedStatistics))
  {}

  void
  SetDemandedStatistics(std::unordered_set<Statistics::Id> demandedStatistics)
  {
    DemandedStatistics_ = std::move(demandedStatistics);
  }

  [[nodiscard]] size_t
  NumDemandedStatistics() const noexcept
  {
    return DemandedStatistics_.size();
  }

  [[nodiscard]] const std::unordered_set<Statistics::Id> &
  GetDemandedStatistics() const noexcept
  {
    return DemandedStatistics_;
  }

  /** \brief Checks if a statistics is demanded.
   *
   * @param id The Id of the statistics.
   * @return True if a statistics is demanded, otherwise false.
   */
  [[nodiscard]] bool
  IsDemanded(Statistics::Id id) const noexcept
  {
    return DemandedStatistics_.find(id) != DemandedStatistics_.end();
  }

private:
  std::unordered_set<Statistics::Id> DemandedStatistics_;
};

/**
 * Collects and prints statistics.
 */
class StatisticsCollector final
{
public:
  StatisticsCollector() = default;

  explicit StatisticsCollector(StatisticsCollectorSettings settings)
      : Settings_(std::move(settings))
  {}

  [[nodiscard]] const StatisticsCollectorSettings &
  GetSettings() const noexcept
  {
    return Settings_;
  }

  [[nodiscard]] const std::vector<std::unique_ptr<Statistics>> &
  CollectedStatistics() const noexcept
  {
    return CollectedStatistics_;
  }

  [[nodiscard]] size_t
  NumCollectedStatistics() const noexcept
  {
    return CollectedStatistics_.size();
  }

  [[nodiscard]] bool
  IsDemanded(Statistics::Id id) const noexcept
  {
    return GetSettings().IsDemanded(id);
  }

  [[nodiscard]] bool
  IsDemanded(const Statistics & statistics) const noexcept
  {
    return IsDemanded(statistics.GetId());
  }

  /**
   * Add \p statistics to collected statistics. A statistics is only added if it is demanded.
   *
   * @param statistics The statistics to collect.
   */
  void
  CollectDemandedStatistics(std::unique_ptr<Statistics> statistics)
  {
    if (IsDemanded(*statistics))
      CollectedStatistics_.emplace_back(std::move(statistics));
  }

  /**
   * \brief Prints collected statistics to \p out, one line per statistics.
   * If no statistics have been collected, this is a no-op.
   */
  void
  PrintStatistics(std::ostream & out) const;

private:
  StatisticsCollectorSettings Settings_;
  std::vector<std::unique_ptr<Statistics>> CollectedStatistics_;
};

}

#endif
