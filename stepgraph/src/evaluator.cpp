// evaluator.cpp - in-memory graph: memoization, request coalescing, recursive evaluation

#include "stepgraph/evaluator.hpp"
#include "stepgraph/debug_log.hpp"
#include "stepgraph/errors.hpp"

#include <condition_variable>
#include <stdexcept>

namespace stepgraph {

namespace {

// Top-level requester: claims every outcome and lets one thread block on it
class BlockingCallback : public LookupCallback {
public:
    void accept_value(const NodeKey&, NodeValuePtr) override {
        signal();
    }

    bool try_handle_error(const NodeKey&, std::exception_ptr) override {
        signal();
        return true;
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return done_; });
    }

private:
    void signal() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
};

} // namespace

// =============================================================================
// FunctionRegistry
// =============================================================================

void FunctionRegistry::register_function(const std::string& name, Factory factory) {
    if (!factory) {
        throw InvariantViolation("Null factory registered for '" + name + "'");
    }
    if (!factories_.emplace(name, std::move(factory)).second) {
        throw InvariantViolation("Function '" + name + "' registered twice");
    }
}

const FunctionRegistry::Factory* FunctionRegistry::find(const std::string& name) const {
    auto it = factories_.find(name);
    return it == factories_.end() ? nullptr : &it->second;
}

// =============================================================================
// Evaluator
// =============================================================================

Evaluator::Evaluator(FunctionRegistry registry, EngineConfig config)
    : registry_(std::move(registry))
    , engine_(std::make_unique<StateMachineEngine>(*this, config)) {}

Evaluator::~Evaluator() {
    engine_.reset();
}

void Evaluator::inject_value(const NodeKey& key, NodeValuePtr value) {
    if (!value) {
        throw InvariantViolation("Null value injected for " + key.to_string());
    }
    inject(EvaluationResult{key, std::move(value), nullptr, CompressedDeps()});
}

void Evaluator::inject_error(const NodeKey& key, std::exception_ptr error) {
    if (!error) {
        throw InvariantViolation("Null error injected for " + key.to_string());
    }
    inject(EvaluationResult{key, nullptr, std::move(error), CompressedDeps()});
}

void Evaluator::inject(EvaluationResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(result.key);
    Entry& entry = it->second;
    if (!inserted && entry.status == Status::IN_PROGRESS) {
        throw InvariantViolation("Cannot inject " + result.key.to_string() + " while it is being computed");
    }
    // Nobody waits on a fresh or finished entry
    entry.status = Status::DONE;
    entry.result = std::move(result);
}

EvaluationResult Evaluator::evaluate(const NodeKey& key) {
    auto waiter = std::make_shared<BlockingCallback>();
    request(key, waiter);
    waiter->wait();

    auto result = result_of(key);
    if (!result) {
        // Invalidated between completion and this read
        throw std::runtime_error(key.to_string() + " was invalidated while being evaluated");
    }
    return *result;
}

std::optional<EvaluationResult> Evaluator::result_of(const NodeKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.status != Status::DONE) {
        return std::nullopt;
    }
    return it->second.result;
}

CompressedDeps Evaluator::deps_of(const NodeKey& key) const {
    auto result = result_of(key);
    if (!result) {
        throw std::out_of_range(key.to_string() + " has not been evaluated");
    }
    return result->deps;
}

bool Evaluator::invalidate(const NodeKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.status != Status::DONE) {
        return false;
    }
    entries_.erase(it);
    return true;
}

void Evaluator::request(const NodeKey& key, std::shared_ptr<LookupCallback> callback) {
    std::optional<EvaluationResult> finished;
    bool start = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = entries_.try_emplace(key);
        Entry& entry = it->second;
        if (entry.status == Status::DONE) {
            finished = entry.result;
        } else {
            entry.waiters.push_back(callback);
            start = inserted;
        }
    }

    if (finished) {
        deliver(*callback, *finished);
    } else if (start) {
        start_computation(key);
    }
}

void Evaluator::start_computation(const NodeKey& key) {
    computations_started_.fetch_add(1, std::memory_order_relaxed);

    const FunctionRegistry::Factory* factory = registry_.find(key.function());
    if (!factory) {
        on_computation_done(EvaluationResult{
            key, nullptr, std::make_exception_ptr(NoSuchFunctionError(key.function())), CompressedDeps()});
        return;
    }

    std::unique_ptr<ValueStateMachine> machine;
    try {
        machine = (*factory)(key);
        if (!machine) {
            throw InvariantViolation("Factory for '" + key.function() + "' returned no state machine");
        }
    } catch (...) {
        on_computation_done(EvaluationResult{key, nullptr, std::current_exception(), CompressedDeps()});
        return;
    }

    engine_->start(key, std::move(machine), [this](const EvaluationResult& result) {
        on_computation_done(result);
    });
}

void Evaluator::on_computation_done(const EvaluationResult& result) {
    std::vector<std::shared_ptr<LookupCallback>> waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry& entry = entries_[result.key];
        entry.status = Status::DONE;
        entry.result = result;
        waiters.swap(entry.waiters);
    }

    for (const auto& waiter : waiters) {
        deliver(*waiter, result);
    }
}

void Evaluator::deliver(LookupCallback& callback, const EvaluationResult& result) {
    if (result.ok()) {
        callback.accept_value(result.key, result.value);
        return;
    }
    if (!callback.try_handle_error(result.key, result.error)) {
        unclaimed_failures_.fetch_add(1, std::memory_order_relaxed);
        STEPGRAPH_DEBUG_LOG("Failure of %s was not claimed by its requester", result.key.to_string().c_str());
    }
}

} // namespace stepgraph
