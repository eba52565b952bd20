#pragma once

#include <source_location>

namespace mc
{
/// Type alias for std::source_location
/// Used by the assertion machinery to report where a check failed
using source_location = std::source_location;
} // namespace mc
