/*
 * 설명: 고정 윈도 요청 제한 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rate_limiter_test.cpp
 */
#include "chessroom/rate_limiter.hpp"

namespace chessroom {

namespace {
constexpr std::size_t kSweepInterval = 1024;
}  // namespace

RateLimiter::RateLimiter(std::size_t max_requests, std::chrono::seconds window)
    : max_requests_(max_requests), window_(window) {}

bool RateLimiter::Allow(const std::string& key, std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (++calls_since_sweep_ >= kSweepInterval) {
    SweepLocked(now);
  }
  auto [it, inserted] = buckets_.try_emplace(key);
  auto& bucket = it->second;
  if (inserted || now - bucket.window_start >= window_) {
    bucket.window_start = now;
    bucket.count = 0;
  }
  if (bucket.count >= max_requests_) {
    return false;
  }
  ++bucket.count;
  return true;
}

void RateLimiter::SweepLocked(std::chrono::steady_clock::time_point now) {
  calls_since_sweep_ = 0;
  for (auto it = buckets_.begin(); it != buckets_.end();) {
    if (now - it->second.window_start >= window_) {
      it = buckets_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace chessroom
