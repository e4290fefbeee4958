/*
 * Copyright 2018 Nico Reißmann <nico.reissmann@gmail.com>
 * See COPYING for terms of redistribution.
 */

#include <graphdot/util/common.hpp>

namespace graphdot::util
{

Error::~Error() noexcept = default;

}
