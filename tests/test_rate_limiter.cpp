#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "tutorguard/security/rate_limiter.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace {

namespace sec = tutorguard::security;
namespace cfg = tutorguard::config;
namespace tg = tutorguard::testing;

using std::chrono::seconds;

} // namespace

void register_rate_limiter_tests(std::vector<tutorguard::tests::TestCase> &tests) {
  using tutorguard::tests::require;

  tests.push_back({"rate_limiter_blocks_after_minute_limit", [] {
                     tg::FakeClock clock;
                     sec::RateLimiter limiter(cfg::RateLimitConfig{}, clock.clock());
                     for (int i = 0; i < 20; ++i) {
                       require(limiter.admit("student-a").passed,
                               "request " + std::to_string(i + 1) + " should pass");
                       clock.advance(seconds(1));
                     }
                     const auto verdict = limiter.admit("student-a");
                     require(!verdict.passed, "21st request must be rejected");
                     require(verdict.reason == "Rate limit exceeded (20 requests/minute)",
                             verdict.reason);
                     require(verdict.retry_after_seconds.has_value(), "retry hint expected");
                     // Oldest stamp is 20s old, so it leaves the window in 40s.
                     require(*verdict.retry_after_seconds == 40,
                             "retry after " + std::to_string(*verdict.retry_after_seconds));
                   }});

  tests.push_back({"rate_limiter_rejection_is_not_counted", [] {
                     tg::FakeClock clock;
                     cfg::RateLimitConfig limits;
                     limits.per_minute = 2;
                     sec::RateLimiter limiter(limits, clock.clock());
                     require(limiter.admit("s").passed && limiter.admit("s").passed, "two pass");
                     require(!limiter.admit("s").passed, "third rejected");
                     require(!limiter.admit("s").passed, "fourth rejected");
                     require(limiter.count_at("s", clock.now()) == 2, "rejections not recorded");
                   }});

  tests.push_back({"rate_limiter_identities_are_independent", [] {
                     tg::FakeClock clock;
                     cfg::RateLimitConfig limits;
                     limits.per_minute = 1;
                     sec::RateLimiter limiter(limits, clock.clock());
                     require(limiter.admit("student-a").passed, "a first");
                     require(!limiter.admit("student-a").passed, "a second rejected");
                     require(limiter.admit("student-b").passed, "b unaffected");
                     require(limiter.tracked_identities() == 2, "two identities tracked");
                   }});

  tests.push_back({"rate_limiter_minute_window_slides", [] {
                     tg::FakeClock clock;
                     cfg::RateLimitConfig limits;
                     limits.per_minute = 3;
                     sec::RateLimiter limiter(limits, clock.clock());
                     for (int i = 0; i < 3; ++i) {
                       require(limiter.admit("s").passed, "fill window");
                     }
                     clock.advance(seconds(59));
                     const auto blocked = limiter.admit("s");
                     require(!blocked.passed, "still inside the minute");
                     require(blocked.retry_after_seconds.value_or(0) == 1, "one second left");
                     clock.advance(seconds(1));
                     require(limiter.admit("s").passed, "exactly 60s old stamps have expired");
                   }});

  tests.push_back({"rate_limiter_enforces_hourly_limit", [] {
                     tg::FakeClock clock;
                     cfg::RateLimitConfig limits;
                     limits.per_minute = 10;
                     limits.per_hour = 5;
                     sec::RateLimiter limiter(limits, clock.clock());
                     for (int i = 0; i < 5; ++i) {
                       require(limiter.admit("s").passed, "under hourly cap");
                       clock.advance(seconds(120));
                     }
                     const auto verdict = limiter.admit("s");
                     require(!verdict.passed, "hourly cap reached");
                     require(verdict.reason == "Hourly rate limit exceeded (5 requests/hour)",
                             verdict.reason);
                     // First stamp is 600s old.
                     require(verdict.retry_after_seconds.value_or(0) == 3000, "retry until expiry");

                     clock.advance(seconds(3000));
                     require(limiter.admit("s").passed, "oldest request left the hour window");
                     require(limiter.count_at("s", clock.now()) == 5, "one expired, one added");
                   }});

  tests.push_back({"rate_limiter_pass_has_no_retry_hint", [] {
                     sec::RateLimiter limiter(cfg::RateLimitConfig{});
                     const auto verdict = limiter.admit("s");
                     require(verdict.passed, "first request passes");
                     require(!verdict.retry_after_seconds.has_value(), "no retry on pass");
                     require(verdict.reason.empty(), "no reason on pass");
                   }});

  tests.push_back({"rate_limiter_forget_clears_history", [] {
                     tg::FakeClock clock;
                     cfg::RateLimitConfig limits;
                     limits.per_minute = 1;
                     sec::RateLimiter limiter(limits, clock.clock());
                     require(limiter.admit("s").passed, "first");
                     require(!limiter.admit("s").passed, "second rejected");
                     limiter.forget("s");
                     require(limiter.tracked_identities() == 0, "window dropped");
                     require(limiter.admit("s").passed, "fresh window after forget");
                   }});

  tests.push_back({"rate_limiter_drops_idle_identities", [] {
                     tg::FakeClock clock;
                     sec::RateLimiter limiter(cfg::RateLimitConfig{}, clock.clock());
                     const auto start = clock.now();
                     for (int i = 0; i < 500; ++i) {
                       require(limiter.admit_at("visitor-" + std::to_string(i), start).passed,
                               "first request passes");
                     }
                     require(limiter.tracked_identities() == 500, "all visitors tracked");

                     require(limiter.admit_at("visitor-0", start + seconds(1800)).passed,
                             "half an hour later");
                     require(limiter.tracked_identities() == 500, "stamps still inside the hour");

                     require(limiter.admit_at("late", start + std::chrono::hours(5)).passed,
                             "late visitor");
                     require(limiter.tracked_identities() == 1,
                             "only the late visitor remains, got " +
                                 std::to_string(limiter.tracked_identities()));
                   }});

  tests.push_back({"identity_digest_is_sha256_hex", [] {
                     require(sec::identity_digest("") ==
                                 "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
                             "sha256 of empty input");
                     require(sec::identity_digest("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256 of abc");
                     require(sec::identity_digest("a") != sec::identity_digest("b"),
                             "distinct identities differ");
                   }});
}
