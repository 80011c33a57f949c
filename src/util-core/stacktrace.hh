#pragma once

#include <stacktrace>

namespace uc
{
/// Snapshot of the call stack, printed by the default assertion handler.
/// Usage:
///   auto trace = uc::stacktrace::current();
///   std::cerr << std::to_string(trace) << '\n';
using stacktrace = std::stacktrace;
} // namespace uc
