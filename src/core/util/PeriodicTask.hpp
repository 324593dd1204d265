#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace ifs {

// Runs a callback on a fixed interval from its own thread until stopped.
// Exceptions thrown by the callback are logged and the loop keeps going.
class PeriodicTask {
public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval,
               std::function<void()> fn);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void start();
  void stop();

private:
  void loop();

  std::string name_;
  std::chrono::milliseconds interval_;
  std::function<void()> fn_;

  std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_ = false;
  std::thread thread_;
};

} // namespace ifs
