/**
 * @file test_parameter_store.cpp
 * @brief Parameter tree: seeding, reads, atomic generation updates
 * 
 * Validates:
 * - JSON seeding into dotted paths, invalid documents rejected
 * - read() / read_subtree() report value and generation
 * - Unknown paths and type mismatches leave the store unchanged
 * - Batches commit as one generation, all or nothing
 * - Snapshots taken before a write never change
 * - Leaves seeded as null accept null and any kind afterwards
 * - on_change callbacks may write to the store again
 */

#include "tickflow/parameters/parameter_store.hpp"
#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace tickflow;

namespace {

const char* kParameters = R"({
    "control": {
        "gain": 0.5,
        "max_steps": 4,
        "enabled": true,
        "mode": "walk",
        "offsets": [0.1, 0.2, 0.3]
    },
    "vision": { "threshold": 0.75 }
})";

} // anonymous namespace

int main() {
    std::cout << "=== Parameter Store Tests ===\n\n";
    
    // Test 1: Seeding
    {
        std::cout << "Test 1: Seed from JSON\n";
        
        auto store = ParameterStore::from_json(kParameters);
        assert(store);
        auto& parameters = **store;
        
        assert(parameters.generation() == 0);
        assert(std::get<double>(parameters.read("control.gain")->value) == 0.5);
        assert(std::get<int64_t>(parameters.read("control.max_steps")->value) == 4);
        assert(std::get<bool>(parameters.read("control.enabled")->value));
        assert(std::get<std::string>(parameters.read("control.mode")->value) == "walk");
        assert(std::get<std::vector<double>>(parameters.read("control.offsets")->value).size() == 3);
        
        assert(!ParameterStore::from_json("not json"));
        assert(ParameterStore::from_json("[1, 2]").error() == ParameterError::InvalidDocument);
        assert(ParameterStore::from_json(R"({"a": [1, "x"]})").error() == ParameterError::InvalidDocument);
        
        std::cout << "  PASS: Nested objects flattened into typed leaves\n\n";
    }
    
    // Test 2: Subtrees
    {
        std::cout << "Test 2: read_subtree\n";
        
        auto store = ParameterStore::from_json(kParameters).value();
        
        auto control = store->read_subtree("control");
        assert(control);
        assert(control->size() == 5);
        for (const auto& [path, reading] : *control) {
            assert(path.rfind("control.", 0) == 0);
            assert(reading.generation == 0);
        }
        
        assert(store->read_subtree("").value().size() == 6);
        assert(store->read_subtree("vision.threshold").value().size() == 1);
        assert(store->read_subtree("contr").error() == ParameterError::UnknownPath);
        assert(store->read("control").error() == ParameterError::UnknownPath);
        
        auto snapshot = store->snapshot();
        assert(snapshot->contains_subtree("control"));
        assert(!snapshot->contains_subtree("control.gain"));
        assert(snapshot->contains_leaf("control.gain"));
        
        std::cout << "  PASS: Subtree reads return every leaf below the path\n\n";
    }
    
    // Test 3: Writes and errors
    {
        std::cout << "Test 3: Writes, unknown paths, type mismatches\n";
        
        auto store = ParameterStore::from_json(kParameters).value();
        
        auto written = store->write("control.gain", 0.8);
        assert(written);
        assert(*written == 1);
        assert(store->read("control.gain")->generation == 1);
        
        // Integer widened into a double leaf
        assert(store->write("control.gain", int64_t{2}));
        assert(std::get<double>(store->read("control.gain")->value) == 2.0);
        assert(store->generation() == 2);
        
        assert(store->write("control.unknown", 1.0).error() == ParameterError::UnknownPath);
        assert(store->write("control.mode", 1.0).error() == ParameterError::TypeMismatch);
        assert(store->write("control.max_steps", 1.5).error() == ParameterError::TypeMismatch);
        assert(store->write(ParameterStore::Batch{}).error() == ParameterError::EmptyBatch);
        assert(store->generation() == 2);
        assert(std::get<std::string>(store->read("control.mode")->value) == "walk");
        
        std::cout << "  PASS: Rejected writes leave store unchanged\n\n";
    }
    
    // Test 4: Batches and callbacks
    {
        std::cout << "Test 4: Atomic batches\n";
        
        auto store = ParameterStore::from_json(kParameters).value();
        std::vector<std::string> notified;
        uint64_t notified_generation = 0;
        store->on_change([&](uint64_t generation, const std::vector<std::string>& paths) {
            notified_generation = generation;
            notified = paths;
        });
        
        auto before = store->snapshot();
        
        auto failed = store->write(ParameterStore::Batch{
            {"control.gain", ParameterValue{0.9}},
            {"control.missing", ParameterValue{1.0}}
        });
        assert(!failed);
        assert(std::get<double>(store->read("control.gain")->value) == 0.5);
        assert(notified.empty());
        
        auto committed = store->write(ParameterStore::Batch{
            {"control.gain", ParameterValue{0.9}},
            {"vision.threshold", ParameterValue{0.6}}
        });
        assert(committed);
        assert(*committed == 1);
        assert(notified_generation == 1);
        assert(notified.size() == 2);
        
        auto after = store->snapshot();
        assert(after->get<double>("control.gain") == 0.9);
        assert(after->get<double>("vision.threshold") == 0.6);
        
        assert(before->generation() == 0);
        assert(before->get<double>("control.gain") == 0.5);
        
        std::cout << "  PASS: All-or-nothing batch, old snapshot unchanged\n\n";
    }
    
    // Test 5: Readers never see a half-applied batch
    {
        std::cout << "Test 5: Concurrent writer, consistent snapshots\n";
        
        auto store = std::make_shared<ParameterStore>(ParameterLeaves{
            {"a", ParameterValue{int64_t{0}}},
            {"b", ParameterValue{int64_t{0}}}
        });
        
        std::atomic<bool> done{false};
        std::thread writer([&]() {
            for (int64_t k = 1; k <= 2000; ++k) {
                auto written = store->write(ParameterStore::Batch{
                    {"a", ParameterValue{k}},
                    {"b", ParameterValue{k}}
                });
                assert(written);
            }
            done.store(true);
        });
        
        bool consistent = true;
        while (!done.load()) {
            auto snapshot = store->snapshot();
            auto a = snapshot->get<int64_t>("a");
            auto b = snapshot->get<int64_t>("b");
            if (a != b || static_cast<uint64_t>(a) != snapshot->generation()) {
                consistent = false;
            }
        }
        writer.join();
        
        assert(consistent);
        assert(store->generation() == 2000);
        
        std::cout << "  PASS: Every snapshot is one generation\n\n";
    }
    
    // Test 6: Nullable leaves
    {
        std::cout << "Test 6: Leaves seeded as null\n";
        
        auto store = ParameterStore::from_json(R"({
            "planner": { "target_x": null, "speed": 0.3 }
        })").value();
        
        auto initial = store->snapshot();
        assert(initial->is_nullable("planner.target_x"));
        assert(!initial->is_nullable("planner.speed"));
        assert(std::holds_alternative<std::monostate>(store->read("planner.target_x")->value));
        assert(!initial->get_optional<double>("planner.target_x").has_value());
        
        assert(store->write("planner.target_x", 1.5));
        assert(store->snapshot()->get_optional<double>("planner.target_x") == 1.5);
        
        // Any kind is accepted, integers read back widened
        assert(store->write("planner.target_x", int64_t{2}));
        assert(store->snapshot()->get_optional<double>("planner.target_x") == 2.0);
        assert(store->write("planner.target_x", std::string("origin")));
        
        assert(store->write_null("planner.target_x"));
        assert(!store->snapshot()->get_optional<double>("planner.target_x").has_value());
        assert(store->generation() == 4);
        
        assert(store->write_null("planner.speed").error() == ParameterError::TypeMismatch);
        assert(store->write_null("planner.missing").error() == ParameterError::UnknownPath);
        assert(store->generation() == 4);
        assert(store->snapshot()->get<double>("planner.speed") == 0.3);
        
        // The snapshot taken before the writes still holds null
        assert(!initial->get_optional<double>("planner.target_x").has_value());
        
        std::cout << "  PASS: Nullable leaf cleared and refilled, others stay typed\n\n";
    }
    
    // Test 7: Callbacks writing back into the store
    {
        std::cout << "Test 7: Re-entrant write from on_change\n";
        
        auto store = ParameterStore::from_json(kParameters).value();
        std::vector<uint64_t> generations;
        store->on_change([&](uint64_t generation, const std::vector<std::string>& paths) {
            generations.push_back(generation);
            if (paths.front() == "control.gain") {
                auto mirrored = store->write("vision.threshold", 0.25);
                assert(mirrored);
            }
        });
        
        auto written = store->write("control.gain", 0.7);
        assert(written);
        assert(*written == 1);
        assert(store->generation() == 2);
        assert(generations == (std::vector<uint64_t>{1, 2}));
        assert(store->snapshot()->get<double>("vision.threshold") == 0.25);
        
        std::cout << "  PASS: Nested write committed as the next generation\n\n";
    }
    
    std::cout << "=== All Parameter Store Tests Passed ===\n";
    return 0;
}
