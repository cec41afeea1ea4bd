#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace KnapEvo {

/**
 * Persistent worker threads for data-parallel population evaluation.
 *
 * run() splits [0, count) into contiguous ranges, hands them to the workers,
 * and blocks until every range is done. Tasks must only write to the slots
 * of their own range. run() is called from one thread at a time (the run
 * loop); an exception thrown by a task is rethrown from run().
 */
class EvaluationPool {
public:
    using RangeTask = std::function<void(size_t begin, size_t end)>;

    explicit EvaluationPool(int workerCount);
    ~EvaluationPool();

    EvaluationPool(const EvaluationPool&) = delete;
    EvaluationPool& operator=(const EvaluationPool&) = delete;

    void run(size_t count, const RangeTask& task);

    int getWorkerCount() const { return static_cast<int>(workers_.size()); }

private:
    struct Range {
        size_t begin = 0;
        size_t end = 0;
    };

    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<Range> taskQueue_;
    const RangeTask* currentTask_ = nullptr;
    size_t pendingRanges_ = 0;
    std::exception_ptr firstError_;
    bool stopRequested_ = false;

    std::mutex taskMutex_;
    std::condition_variable taskCv_;
    std::condition_variable doneCv_;
};

// 0 (or less) means one worker per hardware thread; never more than the population.
int resolveParallelEvaluations(int requested, int populationSize);

} // namespace KnapEvo
