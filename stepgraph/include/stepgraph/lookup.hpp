#ifndef STEPGRAPH_LOOKUP_HPP
#define STEPGRAPH_LOOKUP_HPP

#include <stepgraph/node_key.hpp>
#include <stepgraph/node_value.hpp>
#include <stepgraph/value_or_error.hpp>
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <utility>

namespace stepgraph {

class TaskTreeNode;

/**
 * What the surrounding evaluator calls back when a requested key resolves. Exactly one of
 * the two methods is called, exactly once.
 */
class LookupCallback {
public:
    virtual ~LookupCallback() = default;

    virtual void accept_value(const NodeKey& key, NodeValuePtr value) = 0;

    /**
     * Offers a failure to the requester. Returns true if the requester claimed it.
     * Returns false if it did not; by then the failure has already been routed into the
     * requester's own failure propagation and the evaluator must not retry.
     */
    virtual bool try_handle_error(const NodeKey& key, std::exception_ptr error) = 0;
};

/**
 * Resolves keys for the engine. A request completes through the callback either inline
 * (value already known) or later from any thread.
 */
class LookupEnvironment {
public:
    virtual ~LookupEnvironment() = default;

    virtual void request(const NodeKey& key, std::shared_ptr<LookupCallback> callback) = 0;
};

/**
 * One pending dependency of a task tree node. Delivering the outcome into the sink and
 * signaling the node happen together; an unclaimed failure does not signal the node.
 */
class Lookup : public LookupCallback {
public:
    Lookup(std::shared_ptr<TaskTreeNode> parent, NodeKey key)
        : parent_(std::move(parent)), key_(std::move(key)) {}

    const NodeKey& key() const { return key_; }

    void accept_value(const NodeKey& key, NodeValuePtr value) final;
    bool try_handle_error(const NodeKey& key, std::exception_ptr error) final;

protected:
    virtual void deliver_value(NodeValuePtr value) = 0;

    // True if the sink declared a matching kind and received the failure
    virtual bool deliver_error(const std::exception_ptr& error) = 0;

private:
    void mark_completed();

    std::shared_ptr<TaskTreeNode> parent_;
    NodeKey key_;
    std::atomic<bool> completed_{false};
};

using ValueSink = std::function<void(NodeValuePtr)>;

template<typename... Errors>
using ValueOrErrorSink = std::function<void(const ValueOrError<Errors...>&)>;

// Plain value sink: every failure is unclaimed
class ConsumerLookup final : public Lookup {
public:
    ConsumerLookup(std::shared_ptr<TaskTreeNode> parent, NodeKey key, ValueSink sink)
        : Lookup(std::move(parent), std::move(key)), sink_(std::move(sink)) {}

protected:
    void deliver_value(NodeValuePtr value) override {
        sink_(std::move(value));
    }

    bool deliver_error(const std::exception_ptr&) override {
        return false;
    }

private:
    ValueSink sink_;
};

template<typename... Errors>
class ValueOrErrorLookup final : public Lookup {
public:
    ValueOrErrorLookup(std::shared_ptr<TaskTreeNode> parent, NodeKey key, ValueOrErrorSink<Errors...> sink)
        : Lookup(std::move(parent), std::move(key)), sink_(std::move(sink)) {}

protected:
    void deliver_value(NodeValuePtr value) override {
        sink_(ValueOrError<Errors...>(std::move(value)));
    }

    bool deliver_error(const std::exception_ptr& error) override {
        auto claimed = ErrorMatcher<Errors...>::match(error);
        if (!claimed) {
            return false;
        }
        sink_(ValueOrError<Errors...>(std::move(*claimed)));
        return true;
    }

private:
    ValueOrErrorSink<Errors...> sink_;
};

} // namespace stepgraph

#endif // STEPGRAPH_LOOKUP_HPP
