#ifndef STEPGRAPH_NODE_VALUE_HPP
#define STEPGRAPH_NODE_VALUE_HPP

#include <memory>
#include <utility>

namespace stepgraph {

// Result of one computation. Values are immutable once published.
class NodeValue {
public:
    virtual ~NodeValue() = default;
};

using NodeValuePtr = std::shared_ptr<const NodeValue>;

template<typename T>
class BasicValue : public NodeValue {
private:
    T payload_;

public:
    explicit BasicValue(T payload) : payload_(std::move(payload)) {}

    const T& get() const { return payload_; }
};

template<typename T>
NodeValuePtr make_value(T payload) {
    return std::make_shared<const BasicValue<T>>(std::move(payload));
}

// Returns the payload of a BasicValue<T>, or nullptr if the value holds something else
template<typename T>
const T* value_as(const NodeValuePtr& value) {
    auto* typed = dynamic_cast<const BasicValue<T>*>(value.get());
    return typed ? &typed->get() : nullptr;
}

} // namespace stepgraph

#endif // STEPGRAPH_NODE_VALUE_HPP
