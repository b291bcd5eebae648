#include "EvalTestHelpers.hpp"

#include "directive/DirectiveRegistry.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace RS;
using namespace RS::test;

namespace {

auto sharedScope() -> Node {
    Node::Mapping items;
    for (int i = 0; i < 32; ++i) {
        auto const name = "item" + std::to_string(i);
        Node::Mapping entry{{"id", i}, {"base", Node{Node::Mapping{{"$ref", "local::common"}}}}};
        items.emplace(name, Node{std::move(entry)});
    }
    return Node{Node::Mapping{{"items", Node{std::move(items)}}, {"common", yaml("{region: eu, tags: [a, b]}")}}};
}

auto documentFor(int index) -> Node {
    auto const path = "local::items.item" + std::to_string(index % 32);
    return Node{Node::Mapping{
        {"value", Node{Node::Mapping{{"$ref", path}}}},
        {"merged", Node{Node::Mapping{{"$merge", Node{Node::Sequence{Node{Node::Mapping{{"$ref", "local::common"}}}, yaml("{worker: " + std::to_string(index) + "}")}}}}}},
    }};
}

auto expectedFor(int index) -> Node {
    auto const id = index % 32;
    return yaml("{value: {id: " + std::to_string(id) + ", base: {region: eu, tags: [a, b]}}, merged: {region: eu, tags: [a, b], worker: " + std::to_string(index) + "}}");
}

auto runThreads(Evaluator const& evaluator, int threadCount, int perThread) -> int {
    std::atomic<int>         mismatches{0};
    std::vector<std::thread> threads;
    threads.reserve(threadCount);
    for (int t = 0; t < threadCount; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < perThread; ++i) {
                auto const index  = t * perThread + i;
                auto       result = evaluator.eval(documentFor(index));
                if (!result || *result != expectedFor(index))
                    ++mismatches;
            }
        });
    }
    for (auto& thread : threads)
        thread.join();
    return mismatches.load();
}

} // namespace

TEST_SUITE("eval.concurrency") {
    TEST_CASE("concurrent eval on a shared evaluator") {
        SUBCASE("without cache") {
            EvaluatorOptions options;
            options.localScope = sharedScope();
            Evaluator evaluator{options};
            CHECK(runThreads(evaluator, 8, 40) == 0);
        }
        SUBCASE("with cache") {
            EvaluatorOptions options;
            options.localScope    = sharedScope();
            options.cache.enabled = true;
            Evaluator evaluator{options};
            CHECK(runThreads(evaluator, 8, 40) == 0);
            CHECK(evaluator.cache()->stats().hits > 0);
        }
        SUBCASE("with a small cache under eviction pressure") {
            EvaluatorOptions options;
            options.localScope        = sharedScope();
            options.cache.enabled     = true;
            options.cache.maxCost     = 400;
            options.cache.numCounters = 64;
            Evaluator evaluator{options};
            CHECK(runThreads(evaluator, 8, 40) == 0);
            CHECK(evaluator.cache()->stats().cost <= 400);
        }
    }

    TEST_CASE("cycle guards are per call") {
        EvaluatorOptions options;
        options.localScope = yaml("{a: {$ref: local::b}, b: {$ref: local::c}, c: done, loop: {$ref: local::loop}}");
        Evaluator evaluator{options};

        std::atomic<int>         failures{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 6; ++t) {
            threads.emplace_back([&, t] {
                for (int i = 0; i < 50; ++i) {
                    if (t % 2 == 0) {
                        auto result = evaluator.eval(Node{Node::Mapping{{"$ref", "local::a"}}});
                        if (!result || *result != Node{"done"})
                            ++failures;
                    } else {
                        auto result = evaluator.eval(Node{Node::Mapping{{"$ref", "local::loop"}}});
                        if (result || result.error().code != Error::Code::CycleDetected)
                            ++failures;
                    }
                }
            });
        }
        for (auto& thread : threads)
            thread.join();
        CHECK(failures.load() == 0);
    }

    TEST_CASE("default registry is shared and initialised once") {
        std::atomic<DirectiveRegistry*> seen{nullptr};
        std::atomic<int>                differing{0};
        std::vector<std::thread>        threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&] {
                auto registry = DefaultDirectiveRegistry();
                DirectiveRegistry* expected = nullptr;
                if (!seen.compare_exchange_strong(expected, registry.get()) && expected != registry.get())
                    ++differing;
            });
        }
        for (auto& thread : threads)
            thread.join();
        CHECK(differing.load() == 0);
        CHECK(DefaultDirectiveRegistry()->contains("$merge"));
    }
}
