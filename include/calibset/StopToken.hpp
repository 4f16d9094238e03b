#ifndef CALIBSET_STOP_TOKEN_HPP
#define CALIBSET_STOP_TOKEN_HPP

#include <atomic>

namespace calib {

// Set from a signal handler, polled by the pipeline before each item.
class StopToken {
public:
    void requestStop() noexcept { stop_requested.store(true); }
    bool stopRequested() const noexcept { return stop_requested.load(); }

private:
    std::atomic<bool> stop_requested{false};
};

} // namespace calib

#endif // CALIBSET_STOP_TOKEN_HPP
