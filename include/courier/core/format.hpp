#pragma once

#include <fmt/core.h>

namespace courier::compat {
    using fmt::format;
}
