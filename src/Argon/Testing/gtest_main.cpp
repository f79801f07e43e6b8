//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cstring>

#include <gtest/gtest.h>
#include <loguru.hpp>

auto main(int argc, char** argv) -> int
{
  // Check the program was started just for test case discovery
  bool list_tests = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--gtest_list_tests") == 0) {
      list_tests = true;
      break;
    }
  }

  if (!list_tests) {
    loguru::g_preamble_date = false;
    loguru::g_preamble_file = true;
    loguru::g_preamble_verbose = false;
    loguru::g_preamble_time = false;
    loguru::g_preamble_uptime = false;
    loguru::g_preamble_thread = false;
#if !defined(NDEBUG)
    loguru::g_stderr_verbosity = loguru::Verbosity_1;
#else
    loguru::g_stderr_verbosity = loguru::Verbosity_WARNING;
#endif // !NDEBUG

    // Will also detect verbosity level on command line as -v.
    loguru::init(argc, argv);
  } else {
    loguru::g_stderr_verbosity = loguru::Verbosity_OFF;
  }

  testing::InitGoogleTest(&argc, argv);
  const auto ret = RUN_ALL_TESTS();

  if (!list_tests) {
    loguru::flush();
    loguru::g_stderr_verbosity = loguru::Verbosity_OFF;
    loguru::shutdown();
  }

  return ret;
}
