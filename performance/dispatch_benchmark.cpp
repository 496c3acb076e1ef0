/*
 * dispatch_benchmark.cpp
 *
 *  Created on: 2026-10-15
 */

#include <iostream>
#include <chrono>
#include <vector>
#include "../headers/slotCore.h"

using namespace slot;

SlotObject* benchmarks(
    SlotContext* c,
    SlotObject* self,
    SlotObject* parameter
) {
    const int chain_depth = 64;
    const int num_receivers = 100;
    const int num_dispatches = 1000;
    std::cout << "--- Inherited Dispatch Benchmark ---" << std::endl;
    std::cout << "Chain depth: " << chain_depth << ", Receivers: " << num_receivers
              << ", Dispatches per receiver: " << num_dispatches << std::endl;

    // --- Build Ancestry ---
    SlotObject* root = c->newObject();
    root->assignSlot(c, "marker", c->newObject());

    std::vector<SlotObject*> receivers(num_receivers);
    for (int i = 0; i < num_receivers; ++i) {
        SlotObject* current = root;
        for (int level = 0; level < chain_depth; ++level) {
            current = current->newChild(c);
        }
        current->assignSlot(c, "id", c->fromInteger(i));
        receivers[i] = current;
    }

    // --- Dispatch ---
    // "marker" is a plain object, so every hit evaluates by identity and the
    // timing measures the parent search alone.
    auto start_dispatch = std::chrono::high_resolution_clock::now();
    long long hits = 0;
    for (int i = 0; i < num_receivers; ++i) {
        for (int j = 0; j < num_dispatches; ++j) {
            if (receivers[i]->dispatch(c, "marker") != SLOT_NONE)
                ++hits;
        }
    }
    auto end_dispatch = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff_dispatch = end_dispatch - start_dispatch;

    // --- Verification ---
    long long expected_hits = (long long)num_receivers * num_dispatches;
    if (hits != expected_hits) {
        std::cerr << "Hit count mismatch! Got " << hits << ", expected " << expected_hits << std::endl;
    } else {
        std::cout << "Hit count verified." << std::endl;
    }

    std::cout << "Total dispatch time: " << diff_dispatch.count() << " s" << std::endl;
    std::cout << "--------------------------" << std::endl;

    return SLOT_NONE;
}

int main(int argc, char* argv[]) {
    slot::SlotSpace space;
    benchmarks(space.rootContext, nullptr, nullptr);
    return 0;
}
