#ifndef STEPGRAPH_GROUPED_DEPS_HPP
#define STEPGRAPH_GROUPED_DEPS_HPP

#include <stepgraph/node_key.hpp>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <span>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

namespace stepgraph {

// Immutable multi-key group. Always holds at least two keys; one-key groups are stored bare.
using DepGroup = std::shared_ptr<const std::vector<NodeKey>>;

// One dependency group as stored: a bare key (singleton group) or a multi-key group
using DepEntry = std::variant<NodeKey, DepGroup>;

/**
 * Frozen form of a GroupedDeps, sized for the common cases: no dependencies, a single
 * dependency, or a shared array of entries. Read-only and safe to share between threads.
 */
class CompressedDeps {
public:
    enum class Shape {
        EMPTY,
        SINGLETON,
        MULTIPLE
    };

    CompressedDeps() = default;

    Shape shape() const {
        switch (repr_.index()) {
            case 0: return Shape::EMPTY;
            case 1: return Shape::SINGLETON;
            default: return Shape::MULTIPLE;
        }
    }

    bool is_empty() const { return shape() == Shape::EMPTY; }

    std::size_t num_elements() const;
    std::size_t num_groups() const;

    // Visits every key in group order without decompressing
    template<typename F>
    void for_each_element(F&& f) const {
        if (const auto* key = std::get_if<NodeKey>(&repr_)) {
            f(*key);
        } else if (const auto* entries = std::get_if<Entries>(&repr_)) {
            for (const auto& entry : **entries) {
                if (const auto* bare = std::get_if<NodeKey>(&entry)) {
                    f(*bare);
                } else {
                    for (const auto& grouped : *std::get<DepGroup>(entry)) {
                        f(grouped);
                    }
                }
            }
        }
    }

    std::vector<NodeKey> to_vector() const;

    // True if both sides are packed identically (same shape, same entries, same order)
    bool same_representation(const CompressedDeps& other) const;

    std::string to_string() const;

private:
    friend class GroupedDeps;

    using Entries = std::shared_ptr<const std::vector<DepEntry>>;

    explicit CompressedDeps(NodeKey key) : repr_(std::move(key)) {}
    explicit CompressedDeps(Entries entries) : repr_(std::move(entries)) {}

    std::variant<std::monostate, NodeKey, Entries> repr_;
};

/**
 * Dependencies of one computation, preserving the groups in which they were requested.
 *
 * No duplicate checking is done here; callers only append keys that are not present yet.
 * Groups are stored in request order and compared as unordered sets, so two stores are
 * equal when group i of one holds the same keys as group i of the other.
 *
 * Not thread-safe while mutable. Spans returned by get_group() and the iterators are
 * invalidated by any mutation.
 */
class GroupedDeps {
public:
    class GroupIterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::span<const NodeKey>;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = value_type;

        GroupIterator() = default;
        explicit GroupIterator(std::vector<DepEntry>::const_iterator it) : it_(it) {}

        value_type operator*() const { return GroupedDeps::as_span(*it_); }
        GroupIterator& operator++() { ++it_; return *this; }
        GroupIterator operator++(int) { GroupIterator tmp = *this; ++it_; return tmp; }
        bool operator==(const GroupIterator& other) const { return it_ == other.it_; }
        bool operator!=(const GroupIterator& other) const { return it_ != other.it_; }

    private:
        std::vector<DepEntry>::const_iterator it_;
    };

    // Walks every key in every group, ignoring grouping
    class ElementIterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = NodeKey;
        using difference_type = std::ptrdiff_t;
        using pointer = const NodeKey*;
        using reference = const NodeKey&;

        ElementIterator() = default;
        ElementIterator(const std::vector<DepEntry>* elements, std::size_t outer)
            : elements_(elements), outer_(outer) {}

        reference operator*() const { return GroupedDeps::as_span((*elements_)[outer_])[inner_]; }
        pointer operator->() const { return &**this; }

        ElementIterator& operator++() {
            if (++inner_ == GroupedDeps::as_span((*elements_)[outer_]).size()) {
                ++outer_;
                inner_ = 0;
            }
            return *this;
        }

        ElementIterator operator++(int) { ElementIterator tmp = *this; ++*this; return tmp; }

        bool operator==(const ElementIterator& other) const {
            return outer_ == other.outer_ && inner_ == other.inner_;
        }
        bool operator!=(const ElementIterator& other) const { return !(*this == other); }

    private:
        const std::vector<DepEntry>* elements_ = nullptr;
        std::size_t outer_ = 0;
        std::size_t inner_ = 0;
    };

    class ElementView {
    public:
        explicit ElementView(const GroupedDeps& deps) : deps_(&deps) {}

        ElementIterator begin() const { return ElementIterator(&deps_->elements_, 0); }
        ElementIterator end() const { return ElementIterator(&deps_->elements_, deps_->elements_.size()); }
        std::size_t size() const { return deps_->size_; }

    private:
        const GroupedDeps* deps_;
    };

    GroupedDeps() = default;
    virtual ~GroupedDeps() = default;

    GroupedDeps(const GroupedDeps&) = default;
    GroupedDeps(GroupedDeps&&) = default;
    GroupedDeps& operator=(const GroupedDeps&) = default;
    GroupedDeps& operator=(GroupedDeps&&) = default;

    void ensure_capacity_for_additional_groups(std::size_t additional_groups) {
        elements_.reserve(elements_.size() + additional_groups);
    }

    /**
     * Adds a new group with a single element. The key must not already be present.
     */
    virtual void append_singleton(const NodeKey& key);

    /**
     * Adds a new group. An empty group is ignored and a one-key group is stored exactly as
     * append_singleton() would store it. The group must be duplicate-free and disjoint from
     * the keys already present.
     */
    virtual void append_group(std::span<const NodeKey> group);

    /**
     * Removes the given keys from every group, keeping the relative order of the survivors
     * and dropping groups that become empty. Takes time proportional to the total number of
     * dependencies. Throws InvariantViolation if some requested key was not present.
     */
    virtual void remove(const std::unordered_set<NodeKey>& to_remove);

    // Throws std::out_of_range if i >= num_groups()
    std::span<const NodeKey> get_group(std::size_t i) const;

    std::size_t num_groups() const { return elements_.size(); }

    // Total dependencies across all groups
    std::size_t num_elements() const { return size_; }

    bool is_empty() const { return elements_.empty(); }

    // Linear scan; see GroupedDepsWithHashSet for O(1) membership
    virtual bool contains(const NodeKey& needle) const;

    virtual std::unordered_set<NodeKey> to_set() const;

    CompressedDeps compress() const;
    static GroupedDeps decompress(const CompressedDeps& compressed);

    GroupIterator begin() const { return GroupIterator(elements_.begin()); }
    GroupIterator end() const { return GroupIterator(elements_.end()); }

    ElementView all_elements() const { return ElementView(*this); }

    // Always throws UnsupportedOperation: an order-insensitive hash per group is too costly
    [[noreturn]] std::size_t hash() const;

    bool operator==(const GroupedDeps& other) const;
    bool operator!=(const GroupedDeps& other) const { return !(*this == other); }

    std::string to_string() const;

protected:
    GroupedDeps(std::size_t size, std::vector<DepEntry> elements)
        : size_(size), elements_(std::move(elements)) {}

private:
    static std::span<const NodeKey> as_span(const DepEntry& entry);
    static void add_group(std::span<const NodeKey> group, std::vector<DepEntry>& elements);

    std::size_t size_ = 0;
    std::vector<DepEntry> elements_;
};

/**
 * GroupedDeps that also keeps a hash set of its keys: more memory, O(1) contains(), and
 * duplicate appends are detected and rejected with InvariantViolation.
 */
class GroupedDepsWithHashSet final : public GroupedDeps {
public:
    GroupedDepsWithHashSet() = default;

    void append_singleton(const NodeKey& key) override;
    void append_group(std::span<const NodeKey> group) override;
    void remove(const std::unordered_set<NodeKey>& to_remove) override;

    bool contains(const NodeKey& needle) const override {
        return set_.count(needle) != 0;
    }

    std::unordered_set<NodeKey> to_set() const override {
        return set_;
    }

private:
    std::unordered_set<NodeKey> set_;
};

} // namespace stepgraph

namespace std {
template<>
struct hash<stepgraph::GroupedDeps> {
    std::size_t operator()(const stepgraph::GroupedDeps& deps) const {
        return deps.hash();
    }
};
} // namespace std

#endif // STEPGRAPH_GROUPED_DEPS_HPP
