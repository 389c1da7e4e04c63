#pragma once

#include <iocoro/expected.hpp>

namespace respkit {

using iocoro::expected;
using iocoro::unexpect;
using iocoro::unexpect_t;
using iocoro::unexpected;

}  // namespace respkit
