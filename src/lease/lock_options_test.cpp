//--------------------------------------------------------------------------------------------------
// Copyright (c) 2020 Marcus Geelnard
//
// This software is provided 'as-is', without any express or implied warranty. In no event will the
// authors be held liable for any damages arising from the use of this software.
//
// Permission is granted to anyone to use this software for any purpose, including commercial
// applications, and to alter it and redistribute it freely, subject to the following restrictions:
//
//  1. The origin of this software must not be misrepresented; you must not claim that you wrote
//     the original software. If you use this software in a product, an acknowledgment in the
//     product documentation would be appreciated but is not required.
//
//  2. Altered source versions must be plainly marked as such, and must not be misrepresented as
//     being the original software.
//
//  3. This notice may not be removed or altered from any source distribution.
//--------------------------------------------------------------------------------------------------

#include <lease/lock_options.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace dlease;

TEST_CASE("Lock options are clamped to their valid ranges") {
  SUBCASE("Defaults are kept") {
    const auto opts = lock_options_t().normalized();
    CHECK_EQ(opts.stale_ms, 10000);
    CHECK_EQ(opts.update_ms, 5000);
    CHECK_EQ(opts.resolve_symlinks, true);
    CHECK(opts.fs != nullptr);
  }

  SUBCASE("The stale threshold has a lower bound") {
    lock_options_t opts;
    opts.stale_ms = 100;
    opts.update_ms = 100;
    const auto result = opts.normalized();
    CHECK_EQ(result.stale_ms, 2000);
    CHECK_EQ(result.update_ms, 1000);
  }

  SUBCASE("The update interval is at most half the stale threshold") {
    lock_options_t opts;
    opts.stale_ms = 5001;
    opts.update_ms = 60000;
    const auto result = opts.normalized();
    CHECK_EQ(result.stale_ms, 5001);
    CHECK_EQ(result.update_ms, 2501);
  }

  SUBCASE("A missing file system is replaced by the native one") {
    lock_options_t opts;
    opts.fs.reset();
    CHECK_EQ(opts.normalized().fs, native_file_system());
  }
}

TEST_CASE("Retry policy timeouts") {
  SUBCASE("No retries by default") {
    CHECK(retry_policy_t().timeouts().empty());
  }

  SUBCASE("Exponential back-off") {
    const std::vector<time::millis_t> expected = {1000, 2000, 4000, 8000};
    CHECK_EQ(retry_policy_t(4).timeouts(), expected);
  }

  SUBCASE("Custom parameters and an upper bound") {
    retry_policy_t policy(5);
    policy.min_timeout_ms = 10;
    policy.factor = 3.0;
    policy.max_timeout_ms = 500;
    const std::vector<time::millis_t> expected = {10, 30, 90, 270, 500};
    CHECK_EQ(policy.timeouts(), expected);
  }

  SUBCASE("A zero minimum timeout is treated as one millisecond") {
    retry_policy_t policy(2);
    policy.min_timeout_ms = 0;
    policy.factor = 1.0;
    const std::vector<time::millis_t> expected = {1, 1};
    CHECK_EQ(policy.timeouts(), expected);
  }

  SUBCASE("Randomized timeouts stay within their bounds") {
    retry_policy_t policy(3);
    policy.randomize = true;
    const auto timeouts = policy.timeouts();
    REQUIRE_EQ(timeouts.size(), 3);
    for (std::size_t i = 0; i < timeouts.size(); ++i) {
      const auto base = static_cast<time::millis_t>(1000) << i;
      CHECK_GE(timeouts[i], base);
      CHECK_LE(timeouts[i], 2 * base);
    }
  }
}
