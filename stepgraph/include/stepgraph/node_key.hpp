#ifndef STEPGRAPH_NODE_KEY_HPP
#define STEPGRAPH_NODE_KEY_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <ostream>
#include <string>

namespace stepgraph {

/**
 * Identifies one computation in the graph: the function that computes it and the argument
 * it is computed for. Keys are immutable and cheap to copy (one shared pointer); the hash
 * is computed once at construction.
 */
class NodeKey {
private:
    struct Data {
        std::string function;
        std::string argument;
        std::size_t hash;
    };

    std::shared_ptr<const Data> data_;

public:
    NodeKey(std::string function, std::string argument);

    const std::string& function() const { return data_->function; }
    const std::string& argument() const { return data_->argument; }
    std::size_t hash() const { return data_->hash; }

    std::string to_string() const;

    bool operator==(const NodeKey& other) const {
        if (data_ == other.data_) return true;
        return data_->hash == other.data_->hash &&
               data_->function == other.data_->function &&
               data_->argument == other.data_->argument;
    }

    bool operator!=(const NodeKey& other) const {
        return !(*this == other);
    }
};

std::ostream& operator<<(std::ostream& os, const NodeKey& key);

} // namespace stepgraph

namespace std {
template<>
struct hash<stepgraph::NodeKey> {
    std::size_t operator()(const stepgraph::NodeKey& key) const noexcept {
        return key.hash();
    }
};
} // namespace std

#endif // STEPGRAPH_NODE_KEY_HPP
