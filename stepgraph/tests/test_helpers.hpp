#pragma once
#include <gtest/gtest.h>
#include <stepgraph/lookup.hpp>
#include <stepgraph/node_key.hpp>
#include <stepgraph/node_value.hpp>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace test_utils {

/**
 * Polls `pred` until it holds or the timeout expires
 */
template<typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

/**
 * Lookup environment driven by the test: requests are parked until the test resolves or
 * fails them, from whatever thread it likes.
 */
class ManualEnvironment : public stepgraph::LookupEnvironment {
public:
    void request(const stepgraph::NodeKey& key, std::shared_ptr<stepgraph::LookupCallback> callback) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(Request{key, std::move(callback), false});
        }
        cv_.notify_all();
    }

    // Waits until at least `count` requests have arrived in total
    bool wait_for_requests(std::size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this, count] { return requests_.size() >= count; });
    }

    std::size_t num_requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    std::vector<stepgraph::NodeKey> requested_keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<stepgraph::NodeKey> keys;
        for (const auto& r : requests_) {
            keys.push_back(r.key);
        }
        return keys;
    }

    // Hands out the oldest outstanding request for `key`, or null
    std::shared_ptr<stepgraph::LookupCallback> take(const stepgraph::NodeKey& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& r : requests_) {
            if (!r.taken && r.key == key) {
                r.taken = true;
                return r.callback;
            }
        }
        return nullptr;
    }

    void resolve(const stepgraph::NodeKey& key, stepgraph::NodeValuePtr value) {
        auto callback = take(key);
        ASSERT_TRUE(callback) << "No outstanding request for " << key;
        callback->accept_value(key, std::move(value));
    }

    // Returns whether the requester claimed the failure
    bool fail(const stepgraph::NodeKey& key, std::exception_ptr error) {
        auto callback = take(key);
        EXPECT_TRUE(callback) << "No outstanding request for " << key;
        return callback ? callback->try_handle_error(key, std::move(error)) : false;
    }

private:
    struct Request {
        stepgraph::NodeKey key;
        std::shared_ptr<stepgraph::LookupCallback> callback;
        bool taken;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Request> requests_;
};

inline stepgraph::NodeKey key(const std::string& function, const std::string& argument) {
    return stepgraph::NodeKey(function, argument);
}

/**
 * Rethrows `error` and checks it surfaces as E. Returns the message.
 */
template<typename E>
std::string expect_error_of_type(const std::exception_ptr& error) {
    EXPECT_TRUE(error) << "Expected a failure";
    if (!error) {
        return {};
    }
    try {
        std::rethrow_exception(error);
    } catch (const E& e) {
        return e.what();
    } catch (const std::exception& e) {
        ADD_FAILURE() << "Unexpected failure type: " << e.what();
    }
    return {};
}

} // namespace test_utils
