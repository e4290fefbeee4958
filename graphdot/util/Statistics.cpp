/*
 * Copyright 2020 Nico Reißmann <nico.reissmann@gmail.com>
 * Copyright 2024 Håvard Krogstie <krogstie.havard@gmail.com>
 * See COPYING for terms of redistribution.
 */

#include <graphdot/util/Statistics.hpp>

#include <sstream>

namespace graphdot::util
{

Statistics::~Statistics() = default;

std::string_view
Statistics::GetName() const
{
  switch (StatisticsId_)
  {
  case Id::DotRendering:
    return "DotRendering";
  default:
    GRAPHDOT_UNREACHABLE("Unknown statistics id");
  }
}

std::string
Statistics::Serialize(char fieldSeparator, char nameValueSeparator) const
{
  std::ostringstream ss;

  ss << GetName() << fieldSeparator << GetSubject();

  for (const auto & [mName, measurement] : Measurements_)
  {
    ss << fieldSeparator << mName << nameValueSeparator;
    std::visit(
        [&](const auto & value)
        {
          ss << value;
        },
        measurement);
  }
  for (const auto & [tName, timer] : Timers_)
  {
    ss << fieldSeparator << tName << "[ns]" << nameValueSeparator << timer.ns();
  }

  return ss.str();
}

bool
Statistics::HasMeasurement(const std::string & name) const noexcept
{
  for (const auto & [mName, _] : Measurements_)
    if (mName == name)
      return true;
  return false;
}

const Statistics::Measurement &
Statistics::GetMeasurement(const std::string & name) const
{
  for (const auto & [mName, measurement] : Measurements_)
    if (mName == name)
      return measurement;
  GRAPHDOT_UNREACHABLE("Unknown measurement");
}

bool
Statistics::HasTimer(const std::string & name) const noexcept
{
  for (const auto & [tName, _] : Timers_)
    if (tName == name)
      return true;
  return false;
}

util::Timer &
Statistics::AddTimer(std::string name)
{
  GRAPHDOT_ASSERT(!HasTimer(name));
  Timers_.emplace_back(std::move(name), util::Timer());
  return Timers_.back().second;
}

util::Timer &
Statistics::GetTimer(const std::string & name)
{
  for (auto & [tName, timer] : Timers_)
    if (tName == name)
      return timer;
  GRAPHDOT_UNREACHABLE("Unknown timer");
}

const util::Timer &
Statistics::GetTimer(const std::string & name) const
{
  return const_cast<Statistics *>(this)->GetTimer(name);
}

void
StatisticsCollector::PrintStatistics(std::ostream & out) const
{
  for (const auto & statistics : CollectedStatistics_)
    out << statistics->Serialize(' ', ':') << "\n";
}

}
