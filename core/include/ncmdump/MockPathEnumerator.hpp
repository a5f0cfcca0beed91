#pragma once
#include "PathEnumerator.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <unordered_map>

namespace ncmdump {

// Scripted enumerator: unknown paths expand to themselves, scripted ones to
// their configured result or failure.
class MockPathEnumerator : public PathEnumerator {
public:
  void setResult(const std::string& path, std::vector<std::string> files);
  void setFailure(const std::string& path, std::string error);
  void setDelay(const std::string& path, std::chrono::milliseconds delay);

  bool enumerate(const std::string& path,
                 std::vector<std::string>& out,
                 std::string& err) override;

  std::vector<std::string> calls() const;
  // Highest number of enumerate() calls seen running at the same time.
  int maxConcurrentCalls() const { return maxInFlight_.load(); }

private:
  mutable std::mutex mtx_;
  std::unordered_map<std::string, std::vector<std::string>> results_;
  std::unordered_map<std::string, std::string> failures_;
  std::unordered_map<std::string, std::chrono::milliseconds> delays_;
  std::vector<std::string> calls_;
  std::atomic<int> inFlight_{0};
  std::atomic<int> maxInFlight_{0};
};

} // namespace ncmdump
