#pragma once
/*
 * TaskRunner
 *
 * Purpose: one owned background thread executing posted tasks in order.
 * Lifetime: the destructor stops accepting work, lets the running task finish,
 *           drops tasks that never started, then joins.
 */
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

class TaskRunner {
public:
  TaskRunner();
  ~TaskRunner();
  TaskRunner(const TaskRunner&) = delete;
  TaskRunner& operator=(const TaskRunner&) = delete;

  bool post(std::function<void()> task);
  size_t pending() const;

private:
  void worker_loop();

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  bool stopping_ = false;
  std::thread worker_;
};
