#pragma once

#include <iocoro/expected.hpp>

namespace pipecoro {

using iocoro::expected;
using iocoro::unexpect;
using iocoro::unexpect_t;
using iocoro::unexpected;

}  // namespace pipecoro
