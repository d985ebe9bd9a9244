#pragma once

#include "FitnessEvaluator.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace StackEvo {

struct EvaluationTask {
    int index = -1;
    Program program;
};

/**
 * Scores batches of programs against one Problem, on background workers when more than one
 * evaluation may run at a time.
 *
 * Results are returned slotted by task index, so the order in which workers finish never
 * changes what the caller sees. The Problem must outlive the pool.
 */
class EvaluationPool {
public:
    // maxParallelEvaluations: 0 = hardware concurrency, 1 = evaluate inline on the caller.
    EvaluationPool(FitnessEvaluator evaluator, const Problem& problem, int maxParallelEvaluations);
    ~EvaluationPool();

    EvaluationPool(const EvaluationPool&) = delete;
    EvaluationPool& operator=(const EvaluationPool&) = delete;

    /**
     * Evaluates every task and blocks until all are accounted for. Element i of the result
     * belongs to the task with index i; the vector is sized to the largest task index + 1.
     * Once stopRequested is set, remaining tasks are skipped and their slots left empty.
     */
    std::vector<std::optional<Evaluation>> evaluateAll(
        const std::vector<EvaluationTask>& tasks, const std::atomic<bool>* stopRequested = nullptr);

    int workerCount() const;

private:
    struct WorkerResult {
        int index = -1;
        std::optional<Evaluation> evaluation;
    };

    struct WorkerTask {
        EvaluationTask task;
        const std::atomic<bool>* stopRequested = nullptr;
    };

    struct WorkerState {
        std::vector<std::thread> workers;
        std::deque<WorkerTask> taskQueue;
        std::mutex taskMutex;
        std::condition_variable taskCv;
        std::deque<WorkerResult> resultQueue;
        std::mutex resultMutex;
        std::condition_variable resultCv;
        std::atomic<bool> stopRequested{ false };
    };

    static WorkerResult runEvaluationTask(
        const WorkerTask& task, const FitnessEvaluator& evaluator, const Problem& problem);

    void startWorkers(int count);
    void stopWorkers();

    FitnessEvaluator evaluator_;
    const Problem& problem_;
    std::unique_ptr<WorkerState> workerState_;
};

} // namespace StackEvo
