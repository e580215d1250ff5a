#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>

namespace simgroup {

enum class PipelineStage {
    All,
    Compare,
    Copy
};

struct ProgressInfo {
    size_t totalComparisons = 0;
    size_t totalCopies = 0;
    size_t compareCompleted = 0;
    size_t copyCompleted = 0;
    size_t failedItems = 0;

    float overallProgress() const {
        const size_t total = totalComparisons + totalCopies;
        if (total == 0) return 0.0f;

        return static_cast<float>(compareCompleted + copyCompleted) / total;
    }

    size_t percentComplete(PipelineStage stage) const {
        switch (stage) {
            case PipelineStage::Compare:
                if (totalComparisons == 0) return 0;
                return static_cast<size_t>((static_cast<float>(compareCompleted) / totalComparisons) * 100);
            case PipelineStage::Copy:
                if (totalCopies == 0) return 0;
                return static_cast<size_t>((static_cast<float>(copyCompleted) / totalCopies) * 100);
            default:
                return static_cast<size_t>(overallProgress() * 100);
        }
    }
};

// Thread-safe progress tracker with rate-limited callbacks
class ProgressTracker {
public:
    using ProgressCallback = std::function<void(const ProgressInfo&)>;

    ProgressTracker(size_t totalComparisons, size_t totalCopies, ProgressCallback callback = nullptr,
                    std::chrono::milliseconds minCallbackInterval = std::chrono::milliseconds(500));

    void update(PipelineStage stage, size_t count);
    void updateFailed(size_t count);
    void forceUpdate();

    ProgressInfo getProgress() const;

private:
    std::atomic<size_t> m_totalComparisons;
    std::atomic<size_t> m_totalCopies;
    std::atomic<size_t> m_compareCompleted;
    std::atomic<size_t> m_copyCompleted;
    std::atomic<size_t> m_failedItems;

    ProgressCallback m_callback;
    mutable std::mutex m_callbackMutex;
    std::chrono::steady_clock::time_point m_lastCallbackTime;
    const std::chrono::milliseconds m_minCallbackInterval;

    void tryInvokeCallback();
};

} // namespace simgroup
