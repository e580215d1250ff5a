#include "progress_tracker.hpp"

namespace simgroup {

ProgressTracker::ProgressTracker(size_t totalComparisons, size_t totalCopies, ProgressCallback callback,
                                 std::chrono::milliseconds minCallbackInterval)
    : m_totalComparisons(totalComparisons),
      m_totalCopies(totalCopies),
      m_compareCompleted(0),
      m_copyCompleted(0),
      m_failedItems(0),
      m_callback(std::move(callback)),
      m_lastCallbackTime(std::chrono::steady_clock::now()),
      m_minCallbackInterval(minCallbackInterval)
{
}

void ProgressTracker::update(PipelineStage stage, size_t count) {
    switch (stage) {
        case PipelineStage::Compare:
            m_compareCompleted.fetch_add(count, std::memory_order_relaxed);
            break;
        case PipelineStage::Copy:
            m_copyCompleted.fetch_add(count, std::memory_order_relaxed);
            break;
        default:
            // All is an aggregate, not a countable stage
            break;
    }

    tryInvokeCallback();
}

void ProgressTracker::updateFailed(size_t count) {
    m_failedItems.fetch_add(count, std::memory_order_relaxed);
    tryInvokeCallback();
}

void ProgressTracker::forceUpdate() {
    if (!m_callback) return;

    std::lock_guard<std::mutex> lock(m_callbackMutex);

    ProgressInfo info = getProgress();
    m_callback(info);
    m_lastCallbackTime = std::chrono::steady_clock::now();
}

ProgressInfo ProgressTracker::getProgress() const {
    ProgressInfo info;

    info.totalComparisons = m_totalComparisons.load(std::memory_order_relaxed);
    info.totalCopies = m_totalCopies.load(std::memory_order_relaxed);
    info.compareCompleted = m_compareCompleted.load(std::memory_order_relaxed);
    info.copyCompleted = m_copyCompleted.load(std::memory_order_relaxed);
    info.failedItems = m_failedItems.load(std::memory_order_relaxed);

    return info;
}

void ProgressTracker::tryInvokeCallback() {
    if (!m_callback) return;

    std::unique_lock<std::mutex> lock(m_callbackMutex, std::try_to_lock);
    if (!lock.owns_lock()) return;

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - m_lastCallbackTime);
    if (elapsed < m_minCallbackInterval) return;

    ProgressInfo info = getProgress();
    m_callback(info);
    m_lastCallbackTime = now;
}

} // namespace simgroup
