#include "EvaluationPool.h"
#include "Individual.h"
#include "core/LoggingChannels.h"

#include <algorithm>

namespace ArmySearch {

int resolveWorkerCount(int requested, int taskCount)
{
    int resolved = requested;
    if (resolved <= 0) {
        const unsigned int cores = std::thread::hardware_concurrency();
        resolved = cores > 0 ? static_cast<int>(cores) : 1;
    }

    if (resolved < 1) {
        resolved = 1;
    }
    if (taskCount > 0 && resolved > taskCount) {
        resolved = taskCount;
    }
    return resolved;
}

EvaluationPool::EvaluationPool(const SimulatorOracle& oracle, int workerCount)
    : oracle_(oracle), workerCount_(resolveWorkerCount(workerCount)),
      state_(std::make_unique<WorkerState>())
{
    startWorkers();
    LOG_DEBUG(Evaluation, "Evaluation pool started with {} workers", workerCount_);
}

EvaluationPool::~EvaluationPool()
{
    stopWorkers();
}

void EvaluationPool::startWorkers()
{
    state_->workers.reserve(workerCount_);
    WorkerState* state = state_.get();
    const SimulatorOracle* oracle = &oracle_;

    for (int i = 0; i < workerCount_; ++i) {
        state_->workers.emplace_back([state, oracle]() {
            // One isolated world per worker, never shared.
            std::unique_ptr<SimulationContext> context = oracle->createContext();

            while (true) {
                Job job;
                {
                    std::unique_lock<std::mutex> lock(state->jobMutex);
                    state->jobCv.wait(lock, [state]() {
                        return state->stopRequested || !state->jobQueue.empty();
                    });
                    if (state->stopRequested) {
                        return;
                    }
                    job = std::move(state->jobQueue.front());
                    state->jobQueue.pop_front();
                }

                job(*context);

                {
                    std::lock_guard<std::mutex> lock(state->doneMutex);
                    state->pending--;
                }
                state->doneCv.notify_one();
            }
        });
    }
}

void EvaluationPool::stopWorkers()
{
    state_->stopRequested = true;
    state_->jobCv.notify_all();

    for (auto& worker : state_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    state_->workers.clear();
}

EvaluationPool::TaskResult EvaluationPool::runTask(
    const Task& task,
    const Battle& battle,
    SimulatorOracle::Duration timeout,
    const SimulatorOracle& oracle,
    SimulationContext& context)
{
    try {
        return TaskResult{
            .index = task.index,
            .fitness = simulateFitness(task.army, task.points, battle, oracle, context, timeout),
        };
    }
    catch (const std::exception& e) {
        // A crashing simulation fails this task; the caller decides what to do with the batch.
        LOG_ERROR(
            Evaluation, "Simulator threw for '{}': {}", task.army.shortDescription(), e.what());
        return TaskResult{
            .index = task.index,
            .fitness = Result<Fitness, std::string>::error(
                "Simulator threw for '" + task.army.shortDescription() + "': " + e.what()),
        };
    }
}

void EvaluationPool::runBatch(std::vector<Job> jobs)
{
    std::lock_guard<std::mutex> batchLock(batchMutex_);
    if (jobs.empty()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state_->doneMutex);
        state_->pending = jobs.size();
    }
    {
        std::lock_guard<std::mutex> lock(state_->jobMutex);
        for (auto& job : jobs) {
            state_->jobQueue.push_back(std::move(job));
        }
    }
    state_->jobCv.notify_all();

    std::unique_lock<std::mutex> lock(state_->doneMutex);
    state_->doneCv.wait(lock, [this]() { return state_->pending == 0; });
}

std::vector<EvaluationPool::TaskResult> EvaluationPool::evaluate(
    const Battle& battle, std::vector<Task> tasks, SimulatorOracle::Duration timeout)
{
    // Each job writes only its own slot; runBatch returns after all of them.
    std::vector<TaskResult> results(tasks.size());
    std::vector<Job> jobs;
    jobs.reserve(tasks.size());
    for (size_t slot = 0; slot < tasks.size(); ++slot) {
        jobs.push_back(
            [this, &battle, &tasks, &results, slot, timeout](SimulationContext& context) {
                results[slot] = runTask(tasks[slot], battle, timeout, oracle_, context);
            });
    }
    runBatch(std::move(jobs));

    std::sort(results.begin(), results.end(), [](const TaskResult& a, const TaskResult& b) {
        return a.index < b.index;
    });
    return results;
}

std::vector<Result<BattleResult, std::string>> EvaluationPool::play(
    const std::vector<Match>& matches, SimulatorOracle::Duration timeout)
{
    std::vector<Result<BattleResult, std::string>> results(
        matches.size(), Result<BattleResult, std::string>::error("not run"));
    std::vector<Job> jobs;
    jobs.reserve(matches.size());
    for (size_t slot = 0; slot < matches.size(); ++slot) {
        jobs.push_back([this, &matches, &results, slot, timeout](SimulationContext& context) {
            const Match& match = matches[slot];
            try {
                results[slot] = oracle_.simulate(context, match.ally, match.enemy, timeout);
            }
            catch (const std::exception& e) {
                LOG_ERROR(
                    Evaluation,
                    "Simulator threw for '{}' vs '{}': {}",
                    match.ally.shortDescription(),
                    match.enemy.shortDescription(),
                    e.what());
                results[slot] = Result<BattleResult, std::string>::error(
                    "Simulator threw for '" + match.ally.shortDescription() + "': " + e.what());
            }
        });
    }
    runBatch(std::move(jobs));
    return results;
}

} // namespace ArmySearch
