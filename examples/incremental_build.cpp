/**
 * Incremental Build Example
 *
 * A toy build graph on top of the evaluator:
 * - source(file) values are injected inputs
 * - object(file) looks up its source and fails with CompileError on empty input
 * - binary(name) compiles every object as a child and tolerates compile failures
 * - editing a source and invalidating its dependents rebuilds only what changed
 */

#include <stepgraph/evaluator.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace stepgraph;

namespace {

struct CompileError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

const std::vector<std::string> kSources = {"main.cpp", "parser.cpp", "lexer.cpp"};

class ObjectMachine : public ValueStateMachine {
public:
    explicit ObjectMachine(const NodeKey& key) : file_(key.argument()) {}

    StepResult step(Tasks& tasks) override {
        if (!requested_) {
            requested_ = true;
            tasks.look_up(NodeKey("source", file_), [this](NodeValuePtr source) {
                const std::string* text = value_as<std::string>(source);
                if (!text || text->empty()) {
                    throw CompileError(file_ + ": empty translation unit");
                }
                object_ = file_ + ".o[" + std::to_string(text->size()) + " bytes]";
            });
            return StepResult::CONTINUE;
        }
        return StepResult::DONE;
    }

    NodeValuePtr value() const override { return make_value<std::string>(object_); }

private:
    std::string file_;
    bool requested_ = false;
    std::string object_;
};

// Child of a link step: pulls one object into the link
class CollectObject : public StateMachine {
public:
    CollectObject(std::string file, std::vector<std::string>* slot) : file_(std::move(file)), slot_(slot) {}

    StepResult step(Tasks& tasks) override {
        tasks.look_up(NodeKey("object", file_), [this](NodeValuePtr object) {
            slot_->push_back(*value_as<std::string>(object));
        });
        return StepResult::DONE;
    }

private:
    std::string file_;
    std::vector<std::string>* slot_;
};

class BinaryMachine : public ValueStateMachine {
public:
    explicit BinaryMachine(const NodeKey& key) : name_(key.argument()), collected_(kSources.size()) {}

    StepResult step(Tasks& tasks) override {
        if (started_) {
            return StepResult::DONE;
        }
        started_ = true;
        for (std::size_t i = 0; i < kSources.size(); ++i) {
            tasks.enqueue_catching<CompileError>(
                std::make_unique<CollectObject>(kSources[i], &collected_[i]),
                [this](const ClaimedError<CompileError>& error) {
                    errors_.push_back(error.get<0>()->what());
                });
        }
        return StepResult::CONTINUE;
    }

    NodeValuePtr value() const override {
        std::string out = name_ + " <=";
        for (const auto& slot : collected_) {
            for (const auto& object : slot) {
                out += " " + object;
            }
        }
        for (const auto& error : errors_) {
            out += "\n    skipped: " + error;
        }
        return make_value<std::string>(out);
    }

private:
    std::string name_;
    bool started_ = false;
    std::vector<std::vector<std::string>> collected_;
    std::vector<std::string> errors_;
};

void build(Evaluator& evaluator, const NodeKey& target) {
    auto result = evaluator.evaluate(target);
    if (result.ok()) {
        std::cout << "  " << *value_as<std::string>(result.value) << "\n";
    } else {
        try {
            std::rethrow_exception(result.error);
        } catch (const std::exception& e) {
            std::cout << "  " << target << " failed: " << e.what() << "\n";
        }
    }
    std::cout << "  deps: " << result.deps.to_string() << "\n";
    std::cout << "  computations so far: " << evaluator.computations_started() << "\n\n";
}

} // namespace

int main() {
    std::cout << "=== Incremental Build Example ===\n\n";

    FunctionRegistry registry;
    registry.register_function("object", [](const NodeKey& key) -> std::unique_ptr<ValueStateMachine> {
        return std::make_unique<ObjectMachine>(key);
    });
    registry.register_function("binary", [](const NodeKey& key) -> std::unique_ptr<ValueStateMachine> {
        return std::make_unique<BinaryMachine>(key);
    });

    EngineConfig config;
    config.num_threads = 4;
    Evaluator evaluator(std::move(registry), config);

    evaluator.inject_value(NodeKey("source", "main.cpp"), make_value<std::string>("int main() { return run(); }"));
    evaluator.inject_value(NodeKey("source", "parser.cpp"), make_value<std::string>("Ast parse(Tokens t);"));
    evaluator.inject_value(NodeKey("source", "lexer.cpp"), make_value<std::string>(""));

    const NodeKey app("binary", "app");

    std::cout << "=== Clean build ===\n";
    build(evaluator, app);

    std::cout << "=== Rebuild without changes ===\n";
    build(evaluator, app);

    std::cout << "=== Fix lexer.cpp and rebuild ===\n";
    evaluator.inject_value(NodeKey("source", "lexer.cpp"), make_value<std::string>("Tokens lex(Text t);"));
    evaluator.invalidate(NodeKey("object", "lexer.cpp"));
    evaluator.invalidate(app);
    build(evaluator, app);

    std::cout << "Engine steps executed: " << evaluator.engine().steps_executed() << "\n";
    return 0;
}
