#pragma once

#include <condition_variable>
#include <mutex>

namespace syncq::worker {

/*
  Edge-triggered wakeup for the worker loop.

  Notify() before Wait() is not lost: the next Wait() returns at once.
  Several notifications collapse into one.
*/
class WakeSignal {
 public:
  void Notify();

  // blocking wait; false once Shutdown() was called
  bool Wait();

  void Shutdown();

  // re-arm after Shutdown() so the worker can be started again
  void Reset();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    pending_  = false;
  bool                    shutdown_ = false;
};

} // namespace syncq::worker
