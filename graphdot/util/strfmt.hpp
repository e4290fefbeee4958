/*
 * Copyright 2017 Nico Reißmann <nico.reissmann@gmail.com>
 * See COPYING for terms of redistribution.
 */

#ifndef GRAPHDOT_UTIL_STRFMT_HPP
#define GRAPHDOT_UTIL_STRFMT_HPP

#include <sstream>
#include <string>

namespace graphdot::util
{

template<typename Arg>
static inline void
format_to_stream(std::ostream & os, const Arg & arg)
{
  os << arg;
}

template<typename Arg, typename... Args>
static inline void
format_to_stream(std::ostream & os, const Arg & arg, const Args &... args)
{
  os << arg;
  format_to_stream(os, args...);
}

/**
 * Concatenates the stream representation of all \p args into a string.
 */
template<typename... Args>
static inline std::string
strfmt(const Args &... args)
{
  std::ostringstream os;
  format_to_stream(os, args...);
  return os.str();
}

}

#endif
