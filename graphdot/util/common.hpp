/*
 * Copyright 2014 Nico Reißmann <nico.reissmann@gmail.com>
 * See COPYING for terms of redistribution.
 */

#ifndef GRAPHDOT_UTIL_COMMON_HPP
#define GRAPHDOT_UTIL_COMMON_HPP

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#ifdef GRAPHDOT_ENABLE_ASSERTS
#define GRAPHDOT_ASSERT(x) assert(x)
#else
#define GRAPHDOT_ASSERT(x) \
  do                       \
  {                        \
  } while (0 && (x))
#endif

#define GRAPHDOT_NORETURN __attribute__((noreturn))

namespace graphdot
{

GRAPHDOT_NORETURN static inline void
unreachable(const char * msg, const char * file, unsigned line)
{
  if (msg)
    std::cerr << msg << "\n";

  std::cerr << "UNREACHABLE executed";

  if (file)
    std::cerr << " at " << file << ":" << line << "\n";

  abort();
}

}

#define GRAPHDOT_UNREACHABLE(msg) graphdot::unreachable(msg, __FILE__, __LINE__)

namespace graphdot::util
{

/**
 * Base class of all exceptions thrown by graphdot.
 */
class Error : public std::runtime_error
{
public:
  ~Error() noexcept override;

  explicit Error(const std::string & msg)
      : std::runtime_error(msg)
  {}
};

}

#endif
