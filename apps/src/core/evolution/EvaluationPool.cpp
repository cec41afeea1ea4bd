#include "EvaluationPool.h"

#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>

namespace KnapEvo {

namespace {
// Ranges per worker; more than one keeps workers busy when ranges finish unevenly.
constexpr size_t kRangesPerWorker = 4;
} // namespace

EvaluationPool::EvaluationPool(int workerCount)
{
    KNAPEVO_ASSERT(workerCount > 0, "EvaluationPool needs at least one worker");

    workers_.reserve(workerCount);
    for (int i = 0; i < workerCount; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }
    LOG_DEBUG(Evaluation, "EvaluationPool: started {} workers", workerCount);
}

EvaluationPool::~EvaluationPool()
{
    {
        std::lock_guard<std::mutex> lock(taskMutex_);
        stopRequested_ = true;
    }
    taskCv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    LOG_DEBUG(Evaluation, "EvaluationPool: stopped {} workers", workers_.size());
}

void EvaluationPool::run(size_t count, const RangeTask& task)
{
    if (count == 0) {
        return;
    }

    const size_t rangeCount = std::min(count, workers_.size() * kRangesPerWorker);
    const size_t baseSize = count / rangeCount;
    const size_t remainder = count % rangeCount;

    {
        std::lock_guard<std::mutex> lock(taskMutex_);
        KNAPEVO_ASSERT(currentTask_ == nullptr, "EvaluationPool::run is not reentrant");
        currentTask_ = &task;
        firstError_ = nullptr;

        size_t begin = 0;
        for (size_t r = 0; r < rangeCount; ++r) {
            const size_t size = baseSize + (r < remainder ? 1 : 0);
            taskQueue_.push_back(Range{ .begin = begin, .end = begin + size });
            begin += size;
        }
        pendingRanges_ = rangeCount;
    }
    taskCv_.notify_all();

    std::exception_ptr error;
    {
        std::unique_lock<std::mutex> lock(taskMutex_);
        doneCv_.wait(lock, [this]() { return pendingRanges_ == 0; });
        currentTask_ = nullptr;
        error = firstError_;
        firstError_ = nullptr;
    }

    if (error) {
        std::rethrow_exception(error);
    }
}

void EvaluationPool::workerLoop()
{
    while (true) {
        Range range;
        const RangeTask* task = nullptr;
        {
            std::unique_lock<std::mutex> lock(taskMutex_);
            taskCv_.wait(lock, [this]() { return stopRequested_ || !taskQueue_.empty(); });
            if (stopRequested_) {
                return;
            }
            range = taskQueue_.front();
            taskQueue_.pop_front();
            task = currentTask_;
        }

        std::exception_ptr error;
        try {
            (*task)(range.begin, range.end);
        }
        catch (...) {
            // Handed to run(), which rethrows on the calling thread.
            error = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lock(taskMutex_);
            if (error && !firstError_) {
                firstError_ = error;
            }
            pendingRanges_--;
            if (pendingRanges_ == 0) {
                doneCv_.notify_all();
            }
        }
    }
}

int resolveParallelEvaluations(int requested, int populationSize)
{
    int resolved = requested;
    if (resolved <= 0) {
        const unsigned int cores = std::thread::hardware_concurrency();
        resolved = cores > 0 ? static_cast<int>(cores) : 1;
    }

    if (populationSize > 0 && resolved > populationSize) {
        resolved = populationSize;
    }
    return std::max(resolved, 1);
}

} // namespace KnapEvo
