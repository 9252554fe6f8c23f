// task_tree.cpp - TaskTreeNode counting and state transitions

#include "stepgraph/task_tree.hpp"
#include "stepgraph/engine.hpp"
#include "stepgraph/errors.hpp"

namespace stepgraph {

const char* node_state_name(NodeState state) {
    switch (state) {
        case NodeState::PENDING: return "PENDING";
        case NodeState::RUNNING: return "RUNNING";
        case NodeState::WAITING: return "WAITING";
        case NodeState::DONE: return "DONE";
        case NodeState::ABANDONED: return "ABANDONED";
    }
    return "UNKNOWN";
}

// =============================================================================
// TaskTreeNode
// =============================================================================

TaskTreeNode::TaskTreeNode(std::shared_ptr<Computation> computation,
                           std::shared_ptr<TaskTreeNode> parent,
                           std::unique_ptr<StateMachine> machine,
                           FailureClaim claim)
    : computation_(std::move(computation))
    , parent_(std::move(parent))
    , machine_(std::move(machine))
    , claim_(std::move(claim)) {
    if (!machine_) {
        throw InvariantViolation("Task tree node created without a state machine");
    }
}

void TaskTreeNode::begin_step() {
    set_state(NodeState::RUNNING);
    pending_.fetch_add(1, std::memory_order_acq_rel);
    steps_run_.fetch_add(1, std::memory_order_acq_rel);
}

bool TaskTreeNode::set_state(NodeState state) {
    NodeState current = state_.load(std::memory_order_acquire);
    while (current != NodeState::ABANDONED) {
        if (state_.compare_exchange_weak(current, state, std::memory_order_acq_rel, std::memory_order_acquire)) {
            return true;
        }
    }
    return false;
}

void TaskTreeNode::signal_child_done_and_enqueue_if_ready() {
    std::size_t previous = pending_.fetch_sub(1, std::memory_order_acq_rel);
    if (previous == 0) {
        // More completions than registrations: a lookup or child signaled twice
        pending_.fetch_add(1, std::memory_order_acq_rel);
        fail(std::make_exception_ptr(InvariantViolation(
            "Task tree node of " + computation_->key().to_string() + " signaled with nothing pending")));
        return;
    }
    if (previous == 1) {
        computation_->engine().on_node_ready(shared_from_this());
    }
}

bool TaskTreeNode::abandon() {
    NodeState current = state_.load(std::memory_order_acquire);
    while (current != NodeState::ABANDONED) {
        if (state_.compare_exchange_weak(current, NodeState::ABANDONED,
                                         std::memory_order_acq_rel, std::memory_order_acquire)) {
            return true;
        }
    }
    return false;
}

bool TaskTreeNode::is_orphaned() const {
    for (const TaskTreeNode* node = this; node != nullptr; node = node->parent_.get()) {
        if (node->is_abandoned()) {
            return true;
        }
    }
    return false;
}

bool TaskTreeNode::try_claim_failure(const std::exception_ptr& error) {
    if (!claim_ || !parent_) {
        return false;
    }
    // The claim's sink writes into the parent's machine
    return parent_->deliver([this, &error] { return claim_(error); });
}

void TaskTreeNode::fail(std::exception_ptr error) {
    computation_->engine().propagate_failure(shared_from_this(), std::move(error));
}

} // namespace stepgraph
