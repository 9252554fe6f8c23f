// engine.cpp - StateMachineEngine scheduling, failure propagation and Computation lifecycle

#include "stepgraph/engine.hpp"
#include "stepgraph/debug_log.hpp"
#include "stepgraph/errors.hpp"

#include <unordered_set>

namespace stepgraph {

// =============================================================================
// Computation
// =============================================================================

Computation::Computation(StateMachineEngine& engine, NodeKey key, CompletionCallback on_complete)
    : engine_(engine)
    , key_(std::move(key))
    , on_complete_(std::move(on_complete)) {}

std::shared_ptr<TaskTreeNode> Computation::root() const {
    std::lock_guard<std::mutex> lock(root_mutex_);
    return root_;
}

const EvaluationResult& Computation::wait() {
    std::unique_lock<std::mutex> lock(result_mutex_);
    result_cv_.wait(lock, [this] { return result_.has_value(); });
    return *result_;
}

GroupedDeps Computation::recorded_deps() const {
    std::lock_guard<std::mutex> lock(deps_mutex_);
    return deps_;
}

void Computation::record_group(const std::vector<NodeKey>& keys) {
    std::lock_guard<std::mutex> lock(deps_mutex_);

    std::vector<NodeKey> fresh;
    fresh.reserve(keys.size());
    std::unordered_set<NodeKey> seen;
    for (const auto& key : keys) {
        if (!deps_.contains(key) && seen.insert(key).second) {
            fresh.push_back(key);
        }
    }
    deps_.append_group(fresh);
}

void Computation::complete() {
    NodeValuePtr value;
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(root_mutex_);
        if (!root_machine_) {
            return;
        }
        try {
            value = root_machine_->value();
        } catch (...) {
            error = std::current_exception();
        }
    }

    if (error) {
        fail(std::move(error));
        return;
    }
    if (!value) {
        fail(std::make_exception_ptr(
            InvariantViolation(key_.to_string() + " finished without producing a value")));
        return;
    }
    finish(std::move(value), nullptr);
}

void Computation::fail(std::exception_ptr error) {
    finish(nullptr, std::move(error));
}

void Computation::finish(NodeValuePtr value, std::exception_ptr error) {
    if (finished_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    EvaluationResult result{key_, std::move(value), std::move(error), CompressedDeps()};
    {
        std::lock_guard<std::mutex> lock(deps_mutex_);
        result.deps = deps_.compress();
    }

    STEPGRAPH_DEBUG_LOG("Computation %s finished: %s, %zu deps",
                        key_.to_string().c_str(), result.ok() ? "ok" : "failed",
                        result.deps.num_elements());

    {
        // Releases the tree; nodes still referenced by in-flight lookups die with them
        std::lock_guard<std::mutex> lock(root_mutex_);
        root_.reset();
        root_machine_ = nullptr;
    }

    std::exception_ptr callback_error;
    if (on_complete_) {
        try {
            on_complete_(result);
        } catch (...) {
            callback_error = std::current_exception();
        }
    }

    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        result_.emplace(std::move(result));
    }
    result_cv_.notify_all();

    if (callback_error) {
        std::rethrow_exception(callback_error);
    }
}

// =============================================================================
// StateMachineEngine
// =============================================================================

StateMachineEngine::StateMachineEngine(LookupEnvironment& environment, EngineConfig config)
    : environment_(environment)
    , config_(config)
    , job_system_(std::make_unique<job_system::JobSystem<EngineJobType>>(config.num_threads)) {
    job_system_->start();
}

StateMachineEngine::~StateMachineEngine() {
    if (job_system_) {
        job_system_->shutdown();
    }
}

std::shared_ptr<Computation> StateMachineEngine::start(const NodeKey& key,
                                                       std::unique_ptr<ValueStateMachine> root,
                                                       Computation::CompletionCallback on_complete) {
    if (!root) {
        throw InvariantViolation("Computation of " + key.to_string() + " started without a state machine");
    }

    auto computation = std::make_shared<Computation>(*this, key, std::move(on_complete));
    ValueStateMachine* root_machine = root.get();
    auto root_node = std::make_shared<TaskTreeNode>(computation, nullptr, std::move(root));
    {
        std::lock_guard<std::mutex> lock(computation->root_mutex_);
        computation->root_ = root_node;
        computation->root_machine_ = root_machine;
    }

    STEPGRAPH_DEBUG_LOG("START %s", key.to_string().c_str());
    schedule(std::move(root_node));
    return computation;
}

void StateMachineEngine::wait_idle() {
    job_system_->wait_for_completion();
}

void StateMachineEngine::schedule(std::shared_ptr<TaskTreeNode> node) {
    if (!node->set_state(NodeState::PENDING)) {
        return;
    }
    job_system_->submit_function([this, node = std::move(node)]() {
        run_step(node);
    }, EngineJobType::STEP, config_.resume_mode);
}

void StateMachineEngine::run_step(const std::shared_ptr<TaskTreeNode>& node) {
    if (node->is_orphaned()) {
        return;
    }

    node->begin_step();
    steps_executed_.fetch_add(1, std::memory_order_relaxed);

    Tasks tasks(node);
    StepResult result;
    try {
        result = node->machine().step(tasks);
    } catch (...) {
        propagate_failure(node, std::current_exception());
        return;
    }

    STEPGRAPH_DEBUG_LOG("STEP %s node=%p result=%s lookups=%zu children=%zu",
                        node->computation().key().to_string().c_str(),
                        static_cast<const void*>(node.get()),
                        result == StepResult::DONE ? "DONE" : "CONTINUE",
                        tasks.num_lookups(), tasks.num_children());

    if (result == StepResult::DONE) {
        node->request_finish();
    }
    dispatch(node, tasks.take_lookups(), tasks.take_children());
}

void StateMachineEngine::dispatch(const std::shared_ptr<TaskTreeNode>& node,
                                  std::vector<std::shared_ptr<Lookup>> lookups,
                                  std::vector<Tasks::Child> children) {
    if (!lookups.empty()) {
        std::vector<NodeKey> group;
        group.reserve(lookups.size());
        for (const auto& lookup : lookups) {
            group.push_back(lookup->key());
        }
        node->computation().record_group(group);
    }

    // Everything is counted before anything is dispatched
    node->add_pending(lookups.size() + children.size());
    node->set_state(NodeState::WAITING);

    for (auto& child : children) {
        auto child_node = std::make_shared<TaskTreeNode>(
            node->computation_ptr(), node, std::move(child.machine), std::move(child.claim));
        schedule(std::move(child_node));
    }

    for (auto& lookup : lookups) {
        try {
            environment_.request(lookup->key(), lookup);
        } catch (...) {
            // The environment could not even take the request; treat it as the lookup failing
            lookup->try_handle_error(lookup->key(), std::current_exception());
        }
    }

    // Release the step hold
    node->signal_child_done_and_enqueue_if_ready();
}

void StateMachineEngine::on_node_ready(const std::shared_ptr<TaskTreeNode>& node) {
    // A terminated subtree neither resumes nor reports upward
    if (node->is_orphaned()) {
        return;
    }

    if (!node->finish_requested()) {
        schedule(node);
        return;
    }

    if (!node->set_state(NodeState::DONE)) {
        return;
    }

    if (const auto& parent = node->parent()) {
        parent->signal_child_done_and_enqueue_if_ready();
    } else {
        node->computation().complete();
    }
}

void StateMachineEngine::propagate_failure(std::shared_ptr<TaskTreeNode> node, std::exception_ptr error) {
    std::shared_ptr<TaskTreeNode> current = std::move(node);

    while (current) {
        if (!current->abandon()) {
            // Some other failure already terminated this subtree
            STEPGRAPH_DEBUG_LOG("Dropping failure in abandoned subtree of %s",
                                current->computation().key().to_string().c_str());
            return;
        }

        if (current->has_failure_claim()) {
            bool claimed = false;
            try {
                claimed = current->try_claim_failure(error);
            } catch (...) {
                // The claim's sink failed; continue with that failure from the parent
                error = std::current_exception();
                current = current->parent();
                continue;
            }
            if (claimed) {
                current->parent()->signal_child_done_and_enqueue_if_ready();
                return;
            }
        }

        if (current->is_root()) {
            current->computation().fail(error);
            return;
        }
        current = current->parent();
    }
}

} // namespace stepgraph
