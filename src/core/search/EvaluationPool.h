#pragma once

#include "Fitness.h"
#include "SimulatorOracle.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ArmySearch {

// 0 or less means one worker per hardware thread.
int resolveWorkerCount(int requested, int taskCount = 0);

/**
 * Fixed set of evaluation threads. Each worker creates and owns one
 * SimulationContext for its whole lifetime; only read-only inputs and the
 * finished results cross the thread boundary. Batches either score armies
 * against one battle or play armies against each other.
 */
class EvaluationPool {
public:
    struct Task {
        size_t index = 0;
        Army army;
        int points = 0;
    };

    struct TaskResult {
        size_t index = 0;
        Result<Fitness, std::string> fitness = Result<Fitness, std::string>::error("not run");
    };

    // One battle between two candidate armies; enemy is already on the enemy side.
    struct Match {
        Army ally;
        Army enemy;
    };

    EvaluationPool(const SimulatorOracle& oracle, int workerCount);
    ~EvaluationPool();

    EvaluationPool(const EvaluationPool&) = delete;
    EvaluationPool& operator=(const EvaluationPool&) = delete;

    int workerCount() const { return workerCount_; }

    // Blocks until every task has finished. Results come back ordered by task index.
    std::vector<TaskResult> evaluate(
        const Battle& battle, std::vector<Task> tasks, SimulatorOracle::Duration timeout);

    // Blocks until every match has finished. Results come back in match order.
    std::vector<Result<BattleResult, std::string>> play(
        const std::vector<Match>& matches, SimulatorOracle::Duration timeout);

private:
    using Job = std::function<void(SimulationContext&)>;

    struct WorkerState {
        std::vector<std::thread> workers;
        std::deque<Job> jobQueue;
        std::mutex jobMutex;
        std::condition_variable jobCv;
        std::mutex doneMutex;
        std::condition_variable doneCv;
        size_t pending = 0;
        std::atomic<bool> stopRequested{ false };
    };

    void startWorkers();
    void stopWorkers();
    void runBatch(std::vector<Job> jobs);
    static TaskResult runTask(
        const Task& task,
        const Battle& battle,
        SimulatorOracle::Duration timeout,
        const SimulatorOracle& oracle,
        SimulationContext& context);

    const SimulatorOracle& oracle_;
    int workerCount_ = 1;
    std::unique_ptr<WorkerState> state_;
    std::mutex batchMutex_;
};

} // namespace ArmySearch
