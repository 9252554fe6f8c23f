#ifndef STEPGRAPH_STATE_MACHINE_HPP
#define STEPGRAPH_STATE_MACHINE_HPP

#include <stepgraph/lookup.hpp>
#include <stepgraph/node_key.hpp>
#include <stepgraph/node_value.hpp>
#include <stepgraph/value_or_error.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace stepgraph {

class TaskTreeNode;
class Tasks;

enum class StepResult {
    CONTINUE,  // run step() again once everything issued by this step has completed
    DONE       // no further steps; the node finishes once everything issued has completed
};

/**
 * A resumable computation. step() is re-invoked after each batch of lookups and children
 * it issued has completed, and must carry its own progress marker so a re-invocation
 * only handles the results that just arrived.
 *
 * Sinks registered through Tasks write into the machine's own state. They never run
 * concurrently with step() or with each other.
 */
class StateMachine {
public:
    virtual ~StateMachine() = default;

    virtual StepResult step(Tasks& tasks) = 0;
};

// Root machine of a computation; value() is read once the machine is done
class ValueStateMachine : public StateMachine {
public:
    virtual NodeValuePtr value() const = 0;
};

// Claims a failure escaping a child's subtree; returns false if the kind does not match
using FailureClaim = std::function<bool(const std::exception_ptr&)>;

template<typename... Errors>
using FailureSink = std::function<void(const ClaimedError<Errors...>&)>;

/**
 * Work a step hands back to the engine. All lookups issued during one step form one
 * dependency group. Nothing is dispatched until the step returns.
 */
class Tasks {
public:
    struct Child {
        std::unique_ptr<StateMachine> machine;
        FailureClaim claim;
    };

    explicit Tasks(std::shared_ptr<TaskTreeNode> node) : node_(std::move(node)) {}

    Tasks(const Tasks&) = delete;
    Tasks& operator=(const Tasks&) = delete;

    // Any failure of `key` propagates past this node
    void look_up(const NodeKey& key, ValueSink sink) {
        lookups_.push_back(std::make_shared<ConsumerLookup>(node_, key, std::move(sink)));
    }

    // Failures of `key` that are one of Errors are delivered to the sink instead
    template<typename... Errors>
    void look_up_catching(const NodeKey& key, std::type_identity_t<ValueOrErrorSink<Errors...>> sink) {
        lookups_.push_back(std::make_shared<ValueOrErrorLookup<Errors...>>(node_, key, std::move(sink)));
    }

    // Runs `child` concurrently with the other work of this step
    void enqueue(std::unique_ptr<StateMachine> child) {
        children_.push_back(Child{std::move(child), FailureClaim{}});
    }

    // As enqueue(), and failures escaping the child's subtree that are one of Errors
    // terminate the child and go to the sink
    template<typename... Errors>
    void enqueue_catching(std::unique_ptr<StateMachine> child,
                          std::type_identity_t<FailureSink<Errors...>> sink) {
        FailureClaim claim = [sink = std::move(sink)](const std::exception_ptr& error) {
            auto claimed = ErrorMatcher<Errors...>::match(error);
            if (!claimed) {
                return false;
            }
            sink(*claimed);
            return true;
        };
        children_.push_back(Child{std::move(child), std::move(claim)});
    }

    std::size_t num_lookups() const { return lookups_.size(); }
    std::size_t num_children() const { return children_.size(); }

    std::vector<std::shared_ptr<Lookup>> take_lookups() { return std::move(lookups_); }
    std::vector<Child> take_children() { return std::move(children_); }

private:
    std::shared_ptr<TaskTreeNode> node_;
    std::vector<std::shared_ptr<Lookup>> lookups_;
    std::vector<Child> children_;
};

} // namespace stepgraph

#endif // STEPGRAPH_STATE_MACHINE_HPP
