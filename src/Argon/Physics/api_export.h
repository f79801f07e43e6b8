//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#if defined(_WIN32) || defined(_WIN64)
#  ifdef ARGN_PHY_STATIC
#    define ARGN_PHY_API
#  else
#    ifdef ARGN_PHY_EXPORTS
#      define ARGN_PHY_API __declspec(dllexport)
#    else
#      define ARGN_PHY_API __declspec(dllimport)
#    endif
#  endif
#elif defined(__APPLE__) || defined(__linux__)
#  ifdef ARGN_PHY_EXPORTS
#    define ARGN_PHY_API __attribute__((visibility("default")))
#  else
#    define ARGN_PHY_API
#  endif
#else
#  define ARGN_PHY_API
#endif

#define ARGN_PHY_NDAPI [[nodiscard]] ARGN_PHY_API
