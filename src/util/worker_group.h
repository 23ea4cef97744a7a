#ifndef LUMINA_UTIL_WORKER_GROUP_H
#define LUMINA_UTIL_WORKER_GROUP_H

#include <thread>
#include <utility>
#include <vector>

namespace Lumina {

// Owns a set of worker threads and joins every one that was started when it
// goes out of scope, including while an exception unwinds the caller.
class WorkerGroup {
 public:
  WorkerGroup() {}
  ~WorkerGroup() { join_all(); }

  WorkerGroup(const WorkerGroup&) = delete;
  WorkerGroup& operator=(const WorkerGroup&) = delete;

  // Throws std::system_error when the thread cannot be started.
  template <class F, class... Args>
  void spawn(F&& f, Args&&... args) {
    workers.reserve(workers.size() + 1);
    workers.emplace_back(std::forward<F>(f), std::forward<Args>(args)...);
  }

  void join_all() {
    for (std::thread& t : workers) {
      if (t.joinable()) t.join();
    }
    workers.clear();
  }

  size_t size() const { return workers.size(); }

 private:
  std::vector<std::thread> workers;
};

} // namespace Lumina

#endif // LUMINA_UTIL_WORKER_GROUP_H
