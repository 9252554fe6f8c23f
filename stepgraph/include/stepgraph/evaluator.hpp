#ifndef STEPGRAPH_EVALUATOR_HPP
#define STEPGRAPH_EVALUATOR_HPP

#include <stepgraph/engine.hpp>
#include <stepgraph/lookup.hpp>
#include <stepgraph/node_key.hpp>
#include <stepgraph/node_value.hpp>
#include <stepgraph/state_machine.hpp>
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace stepgraph {

/**
 * Maps function names to factories producing the state machine that computes a key.
 */
class FunctionRegistry {
public:
    using Factory = std::function<std::unique_ptr<ValueStateMachine>(const NodeKey&)>;

    // Throws InvariantViolation if `name` is already registered
    void register_function(const std::string& name, Factory factory);

    // Null if nothing is registered under `name`
    const Factory* find(const std::string& name) const;

    std::size_t size() const { return factories_.size(); }

private:
    std::unordered_map<std::string, Factory> factories_;
};

/**
 * In-memory graph on top of the engine. Keys resolve to injected inputs, to memoized
 * results, or to a fresh computation that may itself look up further keys. Concurrent
 * requests for a key that is still being computed share one computation.
 *
 * Cycles between computations are not detected and never finish.
 */
class Evaluator : public LookupEnvironment {
public:
    explicit Evaluator(FunctionRegistry registry, EngineConfig config = {});
    ~Evaluator() override;

    Evaluator(const Evaluator&) = delete;
    Evaluator& operator=(const Evaluator&) = delete;

    // Input value: no function, no dependencies. Replaces any finished result; throws
    // InvariantViolation while `key` is still being computed.
    void inject_value(const NodeKey& key, NodeValuePtr value);
    void inject_error(const NodeKey& key, std::exception_ptr error);

    // Blocks until `key` is resolved
    EvaluationResult evaluate(const NodeKey& key);

    // Finished result, if any
    std::optional<EvaluationResult> result_of(const NodeKey& key) const;

    // Throws std::out_of_range unless `key` has finished
    CompressedDeps deps_of(const NodeKey& key) const;

    /**
     * Forgets the finished result of `key` so the next request recomputes it. Returns false
     * if there was nothing finished to forget (unknown or still in flight).
     */
    bool invalidate(const NodeKey& key);

    void request(const NodeKey& key, std::shared_ptr<LookupCallback> callback) override;

    std::size_t computations_started() const { return computations_started_.load(std::memory_order_relaxed); }
    std::size_t unclaimed_failures() const { return unclaimed_failures_.load(std::memory_order_relaxed); }

    StateMachineEngine& engine() { return *engine_; }

private:
    enum class Status {
        IN_PROGRESS,
        DONE
    };

    struct Entry {
        Status status = Status::IN_PROGRESS;
        std::optional<EvaluationResult> result;
        std::vector<std::shared_ptr<LookupCallback>> waiters;
    };

    void inject(EvaluationResult result);
    void start_computation(const NodeKey& key);
    void on_computation_done(const EvaluationResult& result);
    void deliver(LookupCallback& callback, const EvaluationResult& result);

    FunctionRegistry registry_;

    mutable std::mutex mutex_;
    std::unordered_map<NodeKey, Entry> entries_;

    std::atomic<std::size_t> computations_started_{0};
    std::atomic<std::size_t> unclaimed_failures_{0};

    // Last member: destroyed first, draining workers before the entries go away
    std::unique_ptr<StateMachineEngine> engine_;
};

} // namespace stepgraph

#endif // STEPGRAPH_EVALUATOR_HPP
