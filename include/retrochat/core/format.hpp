#pragma once

#include <fmt/format.h>

namespace retrochat::compat {
    using fmt::format;
}
