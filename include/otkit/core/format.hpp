#pragma once

#include <fmt/core.h>

namespace otkit::compat {
    using fmt::format;
}
