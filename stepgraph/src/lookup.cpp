// lookup.cpp - one-shot delivery of lookup outcomes into task tree nodes

#include "stepgraph/lookup.hpp"
#include "stepgraph/debug_log.hpp"
#include "stepgraph/errors.hpp"
#include "stepgraph/task_tree.hpp"

namespace stepgraph {

void Lookup::mark_completed() {
    if (completed_.exchange(true, std::memory_order_acq_rel)) {
        throw InvariantViolation("Lookup of " + key_.to_string() + " completed more than once");
    }
}

void Lookup::accept_value(const NodeKey&, NodeValuePtr value) {
    mark_completed();

    if (!value) {
        parent_->fail(std::make_exception_ptr(
            InvariantViolation("Lookup of " + key_.to_string() + " resolved to a null value")));
        return;
    }

    try {
        parent_->deliver([this, &value] {
            deliver_value(std::move(value));
            return true;
        });
    } catch (...) {
        // The sink itself failed; that is a failure of the requesting node
        parent_->fail(std::current_exception());
        return;
    }
    parent_->signal_child_done_and_enqueue_if_ready();
}

bool Lookup::try_handle_error(const NodeKey&, std::exception_ptr error) {
    mark_completed();

    bool handled = false;
    try {
        handled = parent_->deliver([this, &error] { return deliver_error(error); });
    } catch (...) {
        // The sink took the failure but raised its own; the requester fails either way
        parent_->fail(std::current_exception());
        return false;
    }

    if (handled) {
        parent_->signal_child_done_and_enqueue_if_ready();
    } else {
        STEPGRAPH_DEBUG_LOG("Unclaimed failure of %s, propagating", key_.to_string().c_str());
        parent_->fail(std::move(error));
    }
    return handled;
}

} // namespace stepgraph
