#pragma once
#include "Dumper.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace ncmdump {

// Records every call in order; files with a scripted error fail.
// Also tracks how many dump() calls overlap, so tests can check that
// dispatch never runs two dumps at once.
class MockDumper : public Dumper {
public:
  struct Call {
    std::string file;
    std::string outputDir;
  };

  void setFailure(const std::string& file, std::string error);
  void setDelay(std::chrono::milliseconds delay) { delayMs_ = delay.count(); }

  bool dump(const std::string& file_path,
            const std::string& output_dir,
            std::string& err) override;

  std::vector<Call> calls() const;
  int maxConcurrentCalls() const { return maxInFlight_.load(); }

  // Invoked (on the dumping thread) before each call returns.
  void setHook(std::function<void(const std::string&)> hook);

private:
  mutable std::mutex mtx_;
  std::unordered_map<std::string, std::string> failures_;
  std::vector<Call> calls_;
  std::function<void(const std::string&)> hook_;
  std::atomic<long long> delayMs_{0};
  std::atomic<int> inFlight_{0};
  std::atomic<int> maxInFlight_{0};
};

} // namespace ncmdump
