#pragma once

#include <string>
#include <string_view>

namespace oc
{
/// Type alias for std::string
/// Owning text produced by to_string() and collection::join()
using string = std::string;

/// Type alias for std::string_view
/// Non-owning text, e.g. join separators
using string_view = std::string_view;
} // namespace oc
