#ifndef STEPGRAPH_TASK_TREE_HPP
#define STEPGRAPH_TASK_TREE_HPP

#include <stepgraph/state_machine.hpp>
#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>

namespace stepgraph {

class Computation;

enum class NodeState {
    PENDING,    // queued, waiting for a worker
    RUNNING,    // step() executing
    WAITING,    // lookups or children outstanding
    DONE,       // finished and reported to its parent
    ABANDONED   // terminated by a failure in its subtree
};

const char* node_state_name(NodeState state);

/**
 * One node of a computation's in-flight execution tree. Owns its state machine, the
 * count of outstanding lookups and children, and the claim its parent attached for
 * failures escaping this subtree.
 *
 * The pending count is raised for everything a step issues before any of it is
 * dispatched, and the node holds one extra reference while its step runs. The decrement
 * that reaches zero resumes the node; fetch_sub hands that transition to exactly one
 * caller.
 */
class TaskTreeNode : public std::enable_shared_from_this<TaskTreeNode> {
public:
    TaskTreeNode(std::shared_ptr<Computation> computation,
                 std::shared_ptr<TaskTreeNode> parent,
                 std::unique_ptr<StateMachine> machine,
                 FailureClaim claim = {});

    TaskTreeNode(const TaskTreeNode&) = delete;
    TaskTreeNode& operator=(const TaskTreeNode&) = delete;

    StateMachine& machine() { return *machine_; }
    Computation& computation() { return *computation_; }
    const std::shared_ptr<Computation>& computation_ptr() const { return computation_; }
    const std::shared_ptr<TaskTreeNode>& parent() const { return parent_; }
    bool is_root() const { return parent_ == nullptr; }

    NodeState state() const { return state_.load(std::memory_order_acquire); }
    std::size_t pending_count() const { return pending_.load(std::memory_order_acquire); }
    std::size_t steps_run() const { return steps_run_.load(std::memory_order_acquire); }

    // Marks the start of a step: RUNNING, plus the hold reference released by the engine
    void begin_step();

    // Moves to `state` unless the node was abandoned; returns false in that case
    bool set_state(NodeState state);

    void add_pending(std::size_t count) {
        pending_.fetch_add(count, std::memory_order_acq_rel);
    }

    /**
     * Called once per completed lookup or child, and once by the engine to release the
     * step hold. The call that brings the count to zero resumes or finishes the node.
     */
    void signal_child_done_and_enqueue_if_ready();

    void request_finish() { finish_requested_.store(true, std::memory_order_release); }
    bool finish_requested() const { return finish_requested_.load(std::memory_order_acquire); }

    // Returns true only for the call that actually abandoned the node
    bool abandon();
    bool is_abandoned() const { return state() == NodeState::ABANDONED; }

    // True if this node or any ancestor was abandoned
    bool is_orphaned() const;

    /**
     * Runs `sink` under this node's sink mutex unless the node or an ancestor was
     * abandoned. Returns what the sink returned, or false if it did not run. Exceptions
     * from the sink propagate.
     */
    template<typename Sink>
    bool deliver(Sink&& sink) {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (is_orphaned()) {
            return false;
        }
        return sink();
    }

    bool has_failure_claim() const { return static_cast<bool>(claim_); }

    // Offers a failure from this subtree to the claim the parent attached
    bool try_claim_failure(const std::exception_ptr& error);

    // Routes a failure raised at this node into the engine's failure propagation
    void fail(std::exception_ptr error);

private:
    std::shared_ptr<Computation> computation_;
    std::shared_ptr<TaskTreeNode> parent_;
    std::unique_ptr<StateMachine> machine_;
    FailureClaim claim_;

    std::atomic<NodeState> state_{NodeState::PENDING};
    std::atomic<std::size_t> pending_{0};
    std::atomic<std::size_t> steps_run_{0};
    std::atomic<bool> finish_requested_{false};
    std::mutex sink_mutex_;
};

} // namespace stepgraph

#endif // STEPGRAPH_TASK_TREE_HPP
