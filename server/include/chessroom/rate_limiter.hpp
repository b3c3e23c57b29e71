/*
 * 설명: 키(클라이언트 주소)별 고정 윈도 요청 제한.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/rate_limiter_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chessroom {

class RateLimiter {
 public:
  RateLimiter(std::size_t max_requests, std::chrono::seconds window);
  bool Allow(const std::string& key, std::chrono::steady_clock::time_point now);

 private:
  struct Bucket {
    std::size_t count{0};
    std::chrono::steady_clock::time_point window_start{};
  };
  // 만료된 버킷을 정리해 맵이 클라이언트 수만큼 무한히 자라지 않게 한다.
  void SweepLocked(std::chrono::steady_clock::time_point now);

  std::unordered_map<std::string, Bucket> buckets_;
  std::size_t max_requests_;
  std::chrono::seconds window_;
  std::size_t calls_since_sweep_{0};
  std::mutex mutex_;
};

}  // namespace chessroom
