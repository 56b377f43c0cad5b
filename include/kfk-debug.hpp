/**
 * Copyright ©  2025 Chee Bin HOH. All rights reserved.
 *
 * @file include/kfk-debug.hpp
 * @brief Lightweight debug-print macro controlled by the preprocessor.
 *
 * KFK_DEBUG_PRINT(print_stmt) evaluates the given statement when NDEBUG is
 * not defined and compiles to an empty statement otherwise. It is used for
 * developer traces inside the client internals (delivery reports, rebalance
 * callbacks, close sequencing) that are too chatty for the injected
 * Kfk_Logger.
 *
 * Usage example:
 *   KFK_DEBUG_PRINT(std::cerr << "assigned: " << count << '\n');
 *
 * When NDEBUG is defined the print expression is not evaluated, so do not
 * rely on the expression for side effects in release builds.
 */

#ifndef KFK_DEBUG_HPP_
#define KFK_DEBUG_HPP_

#include <iostream>

#ifdef NDEBUG
#define KFK_DEBUG_PRINT(print_stmt)                                            \
  do {                                                                         \
  } while (false)
#else
#define KFK_DEBUG_PRINT(print_stmt)                                            \
  do {                                                                         \
    (print_stmt);                                                              \
  } while (false)
#endif

#endif // KFK_DEBUG_HPP_
