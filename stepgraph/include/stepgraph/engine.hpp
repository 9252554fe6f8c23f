#ifndef STEPGRAPH_ENGINE_HPP
#define STEPGRAPH_ENGINE_HPP

#include <stepgraph/grouped_deps.hpp>
#include <stepgraph/lookup.hpp>
#include <stepgraph/node_key.hpp>
#include <stepgraph/node_value.hpp>
#include <stepgraph/state_machine.hpp>
#include <stepgraph/task_tree.hpp>
#include <job_system/job_system.hpp>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace stepgraph {

class StateMachineEngine;

enum class EngineJobType {
    STEP       // run or resume one task tree node
};

struct EngineConfig {
    std::size_t num_threads = 0;   // 0 = hardware concurrency
    job_system::ScheduleMode resume_mode = job_system::ScheduleMode::LIFO;
};

/**
 * Outcome of one computation: its value or its failure, plus the frozen record of every
 * dependency it requested, in request groups.
 */
struct EvaluationResult {
    NodeKey key;
    NodeValuePtr value;
    std::exception_ptr error;
    CompressedDeps deps;

    bool ok() const { return value != nullptr && !error; }
};

/**
 * One evaluation of one key: the root of its task tree and the dependency groups its
 * steps have issued so far. Finishes exactly once, with a value or with the first
 * failure nothing in the tree claimed.
 */
class Computation {
public:
    using CompletionCallback = std::function<void(const EvaluationResult&)>;

    Computation(StateMachineEngine& engine, NodeKey key, CompletionCallback on_complete);

    Computation(const Computation&) = delete;
    Computation& operator=(const Computation&) = delete;

    const NodeKey& key() const { return key_; }
    StateMachineEngine& engine() { return engine_; }

    bool is_finished() const { return finished_.load(std::memory_order_acquire); }

    // Null once the computation has finished
    std::shared_ptr<TaskTreeNode> root() const;

    // Blocks the calling thread until the computation finishes
    const EvaluationResult& wait();

    // Snapshot of the dependencies recorded so far
    GroupedDeps recorded_deps() const;

    /**
     * Appends the keys one step looked up as a single group. Keys the computation already
     * depends on, and repeats within the group, are skipped.
     */
    void record_group(const std::vector<NodeKey>& keys);

    // Root finished normally
    void complete();

    // Unclaimed failure reached the root
    void fail(std::exception_ptr error);

private:
    friend class StateMachineEngine;

    void finish(NodeValuePtr value, std::exception_ptr error);

    StateMachineEngine& engine_;
    NodeKey key_;
    CompletionCallback on_complete_;

    mutable std::mutex root_mutex_;
    std::shared_ptr<TaskTreeNode> root_;
    ValueStateMachine* root_machine_ = nullptr;

    mutable std::mutex deps_mutex_;
    GroupedDepsWithHashSet deps_;

    std::atomic<bool> finished_{false};
    std::mutex result_mutex_;
    std::condition_variable result_cv_;
    std::optional<EvaluationResult> result_;
};

/**
 * Drives state machines on a work-stealing worker pool. Workers never wait on lookups:
 * a step registers its sinks and returns, and the node is re-enqueued when the last
 * outstanding lookup or child completes.
 */
class StateMachineEngine {
public:
    explicit StateMachineEngine(LookupEnvironment& environment, EngineConfig config = {});
    ~StateMachineEngine();

    StateMachineEngine(const StateMachineEngine&) = delete;
    StateMachineEngine& operator=(const StateMachineEngine&) = delete;

    std::shared_ptr<Computation> start(const NodeKey& key,
                                       std::unique_ptr<ValueStateMachine> root,
                                       Computation::CompletionCallback on_complete = {});

    // Waits until no step is queued or running
    void wait_idle();

    std::size_t num_workers() const { return job_system_->get_num_workers(); }
    std::size_t steps_executed() const { return steps_executed_.load(std::memory_order_relaxed); }

    LookupEnvironment& environment() { return environment_; }

    // Zero-crossing of a node's pending count
    void on_node_ready(const std::shared_ptr<TaskTreeNode>& node);

    /**
     * Walks up from `node` until some node's claim takes the failure. Every node passed on
     * the way is abandoned. A failure that reaches a node that is already abandoned is
     * dropped; one that passes the root fails the computation.
     */
    void propagate_failure(std::shared_ptr<TaskTreeNode> node, std::exception_ptr error);

private:
    void schedule(std::shared_ptr<TaskTreeNode> node);
    void run_step(const std::shared_ptr<TaskTreeNode>& node);
    void dispatch(const std::shared_ptr<TaskTreeNode>& node,
                  std::vector<std::shared_ptr<Lookup>> lookups,
                  std::vector<Tasks::Child> children);

    LookupEnvironment& environment_;
    EngineConfig config_;
    std::atomic<std::size_t> steps_executed_{0};
    std::unique_ptr<job_system::JobSystem<EngineJobType>> job_system_;
};

} // namespace stepgraph

#endif // STEPGRAPH_ENGINE_HPP
