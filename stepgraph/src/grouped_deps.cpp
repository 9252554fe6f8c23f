// grouped_deps.cpp - GroupedDeps storage, removal, equality and compression

#include "stepgraph/grouped_deps.hpp"
#include "stepgraph/errors.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace stepgraph {

namespace {

// Neither side may contain duplicates
bool unordered_equal_without_duplicates(std::span<const NodeKey> first, std::span<const NodeKey> second) {
    if (first.size() != second.size()) {
        return false;
    }
    // Groups usually come back in request order, so try the cheap comparison first
    if (std::equal(first.begin(), first.end(), second.begin())) {
        return true;
    }
    std::unordered_set<NodeKey> lookup(first.begin(), first.end());
    return std::all_of(second.begin(), second.end(), [&lookup](const NodeKey& key) {
        return lookup.count(key) != 0;
    });
}

void append_keys(std::ostringstream& os, std::span<const NodeKey> group) {
    os << "[";
    for (std::size_t i = 0; i < group.size(); ++i) {
        if (i > 0) os << ", ";
        os << group[i];
    }
    os << "]";
}

} // namespace

// =============================================================================
// CompressedDeps
// =============================================================================

std::size_t CompressedDeps::num_elements() const {
    std::size_t count = 0;
    for_each_element([&count](const NodeKey&) { ++count; });
    return count;
}

std::size_t CompressedDeps::num_groups() const {
    switch (shape()) {
        case Shape::EMPTY: return 0;
        case Shape::SINGLETON: return 1;
        case Shape::MULTIPLE: return std::get<Entries>(repr_)->size();
    }
    return 0;
}

std::vector<NodeKey> CompressedDeps::to_vector() const {
    std::vector<NodeKey> keys;
    for_each_element([&keys](const NodeKey& key) { keys.push_back(key); });
    return keys;
}

bool CompressedDeps::same_representation(const CompressedDeps& other) const {
    if (repr_.index() != other.repr_.index()) {
        return false;
    }
    switch (shape()) {
        case Shape::EMPTY:
            return true;
        case Shape::SINGLETON:
            return std::get<NodeKey>(repr_) == std::get<NodeKey>(other.repr_);
        case Shape::MULTIPLE:
            break;
    }

    const auto& mine = *std::get<Entries>(repr_);
    const auto& theirs = *std::get<Entries>(other.repr_);
    if (mine.size() != theirs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < mine.size(); ++i) {
        if (mine[i].index() != theirs[i].index()) {
            return false;
        }
        if (const auto* key = std::get_if<NodeKey>(&mine[i])) {
            if (*key != std::get<NodeKey>(theirs[i])) return false;
        } else if (*std::get<DepGroup>(mine[i]) != *std::get<DepGroup>(theirs[i])) {
            return false;
        }
    }
    return true;
}

std::string CompressedDeps::to_string() const {
    std::ostringstream os;
    switch (shape()) {
        case Shape::EMPTY:
            os << "CompressedDeps{}";
            break;
        case Shape::SINGLETON:
            os << "CompressedDeps{" << std::get<NodeKey>(repr_) << "}";
            break;
        case Shape::MULTIPLE:
            os << "CompressedDeps{";
            for (const auto& entry : *std::get<Entries>(repr_)) {
                if (const auto* key = std::get_if<NodeKey>(&entry)) {
                    os << *key << " ";
                } else {
                    append_keys(os, *std::get<DepGroup>(entry));
                    os << " ";
                }
            }
            os << "}";
            break;
    }
    return os.str();
}

// =============================================================================
// GroupedDeps
// =============================================================================

std::span<const NodeKey> GroupedDeps::as_span(const DepEntry& entry) {
    if (const auto* key = std::get_if<NodeKey>(&entry)) {
        return std::span<const NodeKey>(key, 1);
    }
    const auto& group = *std::get<DepGroup>(entry);
    return std::span<const NodeKey>(group.data(), group.size());
}

void GroupedDeps::add_group(std::span<const NodeKey> group, std::vector<DepEntry>& elements) {
    switch (group.size()) {
        case 0:
            return;
        case 1:
            elements.emplace_back(group[0]);
            return;
        default:
            elements.emplace_back(std::make_shared<const std::vector<NodeKey>>(group.begin(), group.end()));
    }
}

void GroupedDeps::append_singleton(const NodeKey& key) {
    elements_.emplace_back(key);
    ++size_;
}

void GroupedDeps::append_group(std::span<const NodeKey> group) {
    add_group(group, elements_);
    size_ += group.size();
}

void GroupedDeps::remove(const std::unordered_set<NodeKey>& to_remove) {
    if (to_remove.empty()) {
        return;
    }

    std::size_t removed_count = 0;
    std::size_t new_size = 0;
    std::vector<DepEntry> new_elements;
    new_elements.reserve(elements_.size());

    for (const auto& entry : elements_) {
        if (const auto* key = std::get_if<NodeKey>(&entry)) {
            if (to_remove.count(*key) != 0) {
                ++removed_count;
            } else {
                new_elements.push_back(entry);
                ++new_size;
            }
            continue;
        }

        const auto& group = *std::get<DepGroup>(entry);
        std::vector<NodeKey> survivors;
        survivors.reserve(group.size());
        for (const auto& key : group) {
            if (to_remove.count(key) != 0) {
                ++removed_count;
            } else {
                survivors.push_back(key);
            }
        }

        if (survivors.size() == group.size()) {
            new_elements.push_back(entry);  // untouched, keep sharing the group
        } else {
            add_group(survivors, new_elements);
        }
        new_size += survivors.size();
    }

    // removed_count can exceed to_remove.size() only if the store held duplicates
    if (removed_count < to_remove.size()) {
        std::ostringstream os;
        os << "Requested removal of absent element(s): asked for " << to_remove.size()
           << ", found " << removed_count << " in " << to_string();
        throw InvariantViolation(os.str());
    }

    elements_ = std::move(new_elements);
    size_ = new_size;
}

std::span<const NodeKey> GroupedDeps::get_group(std::size_t i) const {
    if (i >= elements_.size()) {
        throw std::out_of_range("Dependency group index " + std::to_string(i) +
                                " out of range (" + std::to_string(elements_.size()) + " groups)");
    }
    return as_span(elements_[i]);
}

bool GroupedDeps::contains(const NodeKey& needle) const {
    for (const auto& entry : elements_) {
        auto group = as_span(entry);
        if (std::find(group.begin(), group.end(), needle) != group.end()) {
            return true;
        }
    }
    return false;
}

std::unordered_set<NodeKey> GroupedDeps::to_set() const {
    std::unordered_set<NodeKey> result;
    result.reserve(size_);
    for (const auto& key : all_elements()) {
        result.insert(key);
    }
    return result;
}

CompressedDeps GroupedDeps::compress() const {
    switch (size_) {
        case 0:
            return CompressedDeps();
        case 1:
            return CompressedDeps(std::get<NodeKey>(elements_.front()));
        default:
            return CompressedDeps(std::make_shared<const std::vector<DepEntry>>(elements_));
    }
}

GroupedDeps GroupedDeps::decompress(const CompressedDeps& compressed) {
    switch (compressed.shape()) {
        case CompressedDeps::Shape::EMPTY:
            return GroupedDeps();
        case CompressedDeps::Shape::SINGLETON:
            return GroupedDeps(1, {DepEntry(std::get<NodeKey>(compressed.repr_))});
        case CompressedDeps::Shape::MULTIPLE:
            break;
    }
    const auto& entries = *std::get<CompressedDeps::Entries>(compressed.repr_);
    return GroupedDeps(compressed.num_elements(), std::vector<DepEntry>(entries.begin(), entries.end()));
}

std::size_t GroupedDeps::hash() const {
    throw UnsupportedOperation("GroupedDeps does not support hashing: " + to_string());
}

bool GroupedDeps::operator==(const GroupedDeps& other) const {
    if (this == &other) {
        return true;
    }
    if (size_ != other.size_ || elements_.size() != other.elements_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < elements_.size(); ++i) {
        const auto& mine = elements_[i];
        const auto& theirs = other.elements_[i];
        if (const auto* key = std::get_if<NodeKey>(&mine)) {
            const auto* other_key = std::get_if<NodeKey>(&theirs);
            if (!other_key || *key != *other_key) {
                return false;
            }
        } else if (!std::holds_alternative<DepGroup>(theirs)) {
            return false;
        } else if (std::get<DepGroup>(mine) != std::get<DepGroup>(theirs) &&
                   !unordered_equal_without_duplicates(as_span(mine), as_span(theirs))) {
            return false;
        }
    }
    return true;
}

std::string GroupedDeps::to_string() const {
    std::ostringstream os;
    os << "GroupedDeps{size=" << size_ << ", groups=";
    for (const auto& entry : elements_) {
        append_keys(os, as_span(entry));
    }
    os << "}";
    return os.str();
}

// =============================================================================
// GroupedDepsWithHashSet
// =============================================================================

void GroupedDepsWithHashSet::append_singleton(const NodeKey& key) {
    if (!set_.insert(key).second) {
        throw InvariantViolation("Duplicate dependency appended: " + key.to_string());
    }
    GroupedDeps::append_singleton(key);
}

void GroupedDepsWithHashSet::append_group(std::span<const NodeKey> group) {
    std::size_t inserted = 0;
    for (const auto& key : group) {
        if (!set_.insert(key).second) {
            // Roll back so the set keeps matching the stored groups
            for (std::size_t i = 0; i < inserted; ++i) {
                set_.erase(group[i]);
            }
            throw InvariantViolation("Duplicate dependency appended: " + key.to_string());
        }
        ++inserted;
    }
    GroupedDeps::append_group(group);
}

void GroupedDepsWithHashSet::remove(const std::unordered_set<NodeKey>& to_remove) {
    GroupedDeps::remove(to_remove);
    for (const auto& key : to_remove) {
        set_.erase(key);
    }
}

} // namespace stepgraph
