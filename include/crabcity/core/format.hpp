#pragma once

#include <fmt/core.h>

namespace crabcity::compat {
    using fmt::format;
}
