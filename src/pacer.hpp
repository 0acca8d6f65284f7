#pragma once

#include <chrono>

namespace erp_sync {

/// Fixed inter-request delay that keeps page fetches from overloading the
/// remote server. There is no adaptive backoff: the delay is the same for
/// every request of a given outcome.
class RequestPacer {
public:
    /// @param successDelay  Pause after a page that loaded normally.
    /// @param failureDelay  Pause after a page that needed fault isolation.
    explicit RequestPacer(std::chrono::milliseconds successDelay = std::chrono::milliseconds(300),
                          std::chrono::milliseconds failureDelay = std::chrono::milliseconds(500));

    void pauseAfterSuccess();
    void pauseAfterFailure();

    // ---- accessors for summary report ----
    double totalSleepSeconds() const { return mTotalSleep; }
    int    totalPauses()       const { return mPauseCount; }

private:
    std::chrono::milliseconds mSuccessDelay;
    std::chrono::milliseconds mFailureDelay;

    double mTotalSleep = 0.0;
    int    mPauseCount = 0;

    void pause(std::chrono::milliseconds delay);
};

} // namespace erp_sync
