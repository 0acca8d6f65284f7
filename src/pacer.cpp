#include "pacer.hpp"

#include <thread>

namespace erp_sync {

RequestPacer::RequestPacer(std::chrono::milliseconds successDelay,
                           std::chrono::milliseconds failureDelay)
    : mSuccessDelay(successDelay < std::chrono::milliseconds::zero()
                        ? std::chrono::milliseconds::zero() : successDelay)
    , mFailureDelay(failureDelay < std::chrono::milliseconds::zero()
                        ? std::chrono::milliseconds::zero() : failureDelay) {}

void RequestPacer::pauseAfterSuccess() {
    pause(mSuccessDelay);
}

void RequestPacer::pauseAfterFailure() {
    pause(mFailureDelay);
}

void RequestPacer::pause(std::chrono::milliseconds delay) {
    ++mPauseCount;
    if (delay.count() == 0) return;

    mTotalSleep += static_cast<double>(delay.count()) / 1000.0;
    std::this_thread::sleep_for(delay);
}

} // namespace erp_sync
