/**
 * @file Assert.hpp
 * @brief Debug-only assertion routed through the Log façade.
 *
 * ORB_ASSERT checks internal invariants (never user input) in debug builds
 * and compiles to nothing otherwise.  A failure is reported as a fatal
 * "assert" log entry before the process aborts, so an installed ILogger
 * sees it too.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_CORE_ASSERT_HPP
    #define ORB_CORE_ASSERT_HPP

    #include "Log.hpp"

    #include <cstdlib>
    #include <source_location>
    #include <string>

namespace orb::core::detail {

[[noreturn]] inline void assertFail(const char *expr,
                                    std::source_location loc = std::source_location::current())
{
    Log::fatal("assert", std::string{loc.file_name()} + ":" + std::to_string(loc.line()) + " in "
                             + loc.function_name() + ": '" + expr + "' failed");
    std::abort();
}

} // namespace orb::core::detail

    #ifdef ORB_DEBUG
        #define ORB_ASSERT(cond)                                \
            do {                                                \
                if (!(cond)) [[unlikely]]                       \
                    ::orb::core::detail::assertFail(#cond);     \
            } while (false)
    #else
        #define ORB_ASSERT(cond) ((void)0)
    #endif

#endif // ORB_CORE_ASSERT_HPP
