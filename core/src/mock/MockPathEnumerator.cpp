#include "ncmdump/MockPathEnumerator.hpp"
#include <thread>

namespace ncmdump {

void MockPathEnumerator::setResult(const std::string& path,
                                   std::vector<std::string> files) {
  std::lock_guard<std::mutex> lk(mtx_);
  failures_.erase(path);
  results_[path] = std::move(files);
}

void MockPathEnumerator::setFailure(const std::string& path, std::string error) {
  std::lock_guard<std::mutex> lk(mtx_);
  results_.erase(path);
  failures_[path] = std::move(error);
}

void MockPathEnumerator::setDelay(const std::string& path,
                                  std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lk(mtx_);
  delays_[path] = delay;
}

bool MockPathEnumerator::enumerate(const std::string& path,
                                   std::vector<std::string>& out,
                                   std::string& err) {
  const int now = inFlight_.fetch_add(1) + 1;
  int prevMax = maxInFlight_.load();
  while (now > prevMax && !maxInFlight_.compare_exchange_weak(prevMax, now)) {
  }

  std::chrono::milliseconds delay{0};
  {
    std::lock_guard<std::mutex> lk(mtx_);
    calls_.push_back(path);
    auto d = delays_.find(path);
    if (d != delays_.end())
      delay = d->second;
  }
  if (delay.count() > 0)
    std::this_thread::sleep_for(delay);

  bool ok = true;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto f = failures_.find(path);
    if (f != failures_.end()) {
      err = f->second;
      ok = false;
    } else {
      auto it = results_.find(path);
      if (it != results_.end())
        out = it->second;
      else
        out = {path};
    }
  }
  inFlight_.fetch_sub(1);
  return ok;
}

std::vector<std::string> MockPathEnumerator::calls() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return calls_;
}

} // namespace ncmdump
