#pragma once

#include <source_location>

namespace oc
{
/// Type alias for std::source_location
/// Captured by assertions and index checks to report the failing call site
/// Usage:
///   void check(oc::source_location loc = oc::source_location::current());
using source_location = std::source_location;
} // namespace oc
