#include "EvaluationPool.h"
#include "core/LoggingChannels.h"

#include <algorithm>

namespace StackEvo {

namespace {
bool isStopped(const std::atomic<bool>* stopRequested)
{
    return stopRequested && stopRequested->load(std::memory_order_relaxed);
}
} // namespace

EvaluationPool::EvaluationPool(
    FitnessEvaluator evaluator, const Problem& problem, int maxParallelEvaluations)
    : evaluator_(std::move(evaluator)), problem_(problem)
{
    int count = maxParallelEvaluations;
    if (count == 0) {
        count = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
    }
    if (count > 1) {
        startWorkers(count);
    }
}

EvaluationPool::~EvaluationPool()
{
    stopWorkers();
}

int EvaluationPool::workerCount() const
{
    return workerState_ ? static_cast<int>(workerState_->workers.size()) : 0;
}

EvaluationPool::WorkerResult EvaluationPool::runEvaluationTask(
    const WorkerTask& task, const FitnessEvaluator& evaluator, const Problem& problem)
{
    WorkerResult result;
    result.index = task.task.index;
    if (isStopped(task.stopRequested)) {
        return result;
    }

    Evaluation evaluation = evaluator.evaluate(task.task.program, problem, task.stopRequested);
    if (!evaluation.cancelled) {
        result.evaluation = evaluation;
    }
    return result;
}

void EvaluationPool::startWorkers(int count)
{
    workerState_ = std::make_unique<WorkerState>();
    workerState_->workers.reserve(count);

    WorkerState* state = workerState_.get();
    const FitnessEvaluator* evaluator = &evaluator_;
    const Problem* problem = &problem_;
    for (int i = 0; i < count; ++i) {
        workerState_->workers.emplace_back([state, evaluator, problem]() {
            while (true) {
                WorkerTask task;
                {
                    std::unique_lock<std::mutex> lock(state->taskMutex);
                    state->taskCv.wait(lock, [state]() {
                        return state->stopRequested || !state->taskQueue.empty();
                    });
                    if (state->stopRequested) {
                        return;
                    }
                    task = std::move(state->taskQueue.front());
                    state->taskQueue.pop_front();
                }

                WorkerResult result = runEvaluationTask(task, *evaluator, *problem);

                {
                    std::lock_guard<std::mutex> lock(state->resultMutex);
                    state->resultQueue.push_back(std::move(result));
                }
                state->resultCv.notify_one();
            }
        });
    }

    LOG_DEBUG(Fitness, "Started {} evaluation workers", count);
}

void EvaluationPool::stopWorkers()
{
    if (!workerState_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(workerState_->taskMutex);
        workerState_->stopRequested = true;
    }
    workerState_->taskCv.notify_all();

    for (auto& worker : workerState_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workerState_->workers.clear();

    {
        std::lock_guard<std::mutex> lock(workerState_->taskMutex);
        workerState_->taskQueue.clear();
    }
    {
        std::lock_guard<std::mutex> lock(workerState_->resultMutex);
        workerState_->resultQueue.clear();
    }
}

std::vector<std::optional<Evaluation>> EvaluationPool::evaluateAll(
    const std::vector<EvaluationTask>& tasks, const std::atomic<bool>* stopRequested)
{
    int slots = 0;
    for (const auto& task : tasks) {
        slots = std::max(slots, task.index + 1);
    }
    std::vector<std::optional<Evaluation>> evaluations(slots);

    if (!workerState_) {
        for (const auto& task : tasks) {
            WorkerResult result =
                runEvaluationTask(WorkerTask{ task, stopRequested }, evaluator_, problem_);
            evaluations[result.index] = std::move(result.evaluation);
        }
        return evaluations;
    }

    {
        std::lock_guard<std::mutex> lock(workerState_->taskMutex);
        for (const auto& task : tasks) {
            workerState_->taskQueue.push_back(WorkerTask{ task, stopRequested });
        }
    }
    workerState_->taskCv.notify_all();

    size_t received = 0;
    while (received < tasks.size()) {
        std::deque<WorkerResult> results;
        {
            std::unique_lock<std::mutex> lock(workerState_->resultMutex);
            workerState_->resultCv.wait(
                lock, [this]() { return !workerState_->resultQueue.empty(); });
            results.swap(workerState_->resultQueue);
        }
        for (auto& result : results) {
            evaluations[result.index] = std::move(result.evaluation);
            received++;
        }
    }

    return evaluations;
}

} // namespace StackEvo
