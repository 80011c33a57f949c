#pragma once

#include <source_location>

namespace uc
{
/// Type alias for std::source_location
/// Captured by assertions to report file, line, column and function of the failing check
/// Usage:
///   void log(uc::source_location loc = uc::source_location::current()) {
///       std::cerr << loc.file_name() << ":" << loc.line();
///   }
using source_location = std::source_location;
} // namespace uc
