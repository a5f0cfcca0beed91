#include "ncmdump/MockDumper.hpp"
#include <thread>

namespace ncmdump {

void MockDumper::setFailure(const std::string& file, std::string error) {
  std::lock_guard<std::mutex> lk(mtx_);
  failures_[file] = std::move(error);
}

void MockDumper::setHook(std::function<void(const std::string&)> hook) {
  std::lock_guard<std::mutex> lk(mtx_);
  hook_ = std::move(hook);
}

bool MockDumper::dump(const std::string& file_path,
                      const std::string& output_dir,
                      std::string& err) {
  const int now = inFlight_.fetch_add(1) + 1;
  int prevMax = maxInFlight_.load();
  while (now > prevMax && !maxInFlight_.compare_exchange_weak(prevMax, now)) {
  }

  std::function<void(const std::string&)> hook;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    calls_.push_back({file_path, output_dir});
    hook = hook_;
  }
  const long long delay = delayMs_.load();
  if (delay > 0)
    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
  if (hook)
    hook(file_path);

  bool ok = true;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto f = failures_.find(file_path);
    if (f != failures_.end()) {
      err = f->second;
      ok = false;
    }
  }
  inFlight_.fetch_sub(1);
  return ok;
}

std::vector<MockDumper::Call> MockDumper::calls() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return calls_;
}

} // namespace ncmdump
