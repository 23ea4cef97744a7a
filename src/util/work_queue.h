#ifndef LUMINA_UTIL_WORK_QUEUE_H
#define LUMINA_UTIL_WORK_QUEUE_H

#include <deque>
#include <mutex>

namespace Lumina {

// Mutex guarded FIFO shared by the render workers.
template <class T>
class WorkQueue {
 public:
  bool try_get_work(T* out) {
    std::lock_guard<std::mutex> lock(mutex);
    if (jobs.empty()) return false;
    *out = jobs.front();
    jobs.pop_front();
    return true;
  }

  void put_work(const T& item) {
    std::lock_guard<std::mutex> lock(mutex);
    jobs.push_back(item);
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex);
    jobs.clear();
  }

 private:
  std::mutex mutex;
  std::deque<T> jobs;
};

} // namespace Lumina

#endif // LUMINA_UTIL_WORK_QUEUE_H
