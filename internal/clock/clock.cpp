#include "clock.hpp"

#include <memory>

namespace syncq::clock {

std::future<void> Clock::Sleep(Duration d) {
  auto done   = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  Schedule(d, [done] { done->set_value(); });
  return future;
}

} // namespace syncq::clock
