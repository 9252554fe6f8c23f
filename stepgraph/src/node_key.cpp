// node_key.cpp - NodeKey construction and formatting

#include "stepgraph/node_key.hpp"

namespace stepgraph {

NodeKey::NodeKey(std::string function, std::string argument) {
    std::size_t h = std::hash<std::string>{}(function);
    // boost::hash_combine mixing
    h ^= std::hash<std::string>{}(argument) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    data_ = std::make_shared<const Data>(Data{std::move(function), std::move(argument), h});
}

std::string NodeKey::to_string() const {
    return data_->function + "(" + data_->argument + ")";
}

std::ostream& operator<<(std::ostream& os, const NodeKey& key) {
    return os << key.to_string();
}

} // namespace stepgraph
