/*
 * chain_benchmark.cpp
 *
 *  Created on: 2026-10-15
 */

#include <iostream>
#include <chrono>
#include "../headers/slotCore.h"

using namespace slot;

SlotObject* benchmarks(
    SlotContext* c,
    SlotObject* self,
    SlotObject* parameter
) {
    const int num_iterations = 100000;
    std::cout << "--- Increment Benchmark ---" << std::endl;
    std::cout << "Iterations: " << num_iterations << std::endl;

    // --- Parameterized dispatch through the number traits ---
    auto start = std::chrono::high_resolution_clock::now();
    SlotObject* counter = c->fromInteger(0);
    counter->assignParentSlot(c, "traits", c->space->numberTraits);
    for (int i = 0; i < num_iterations; ++i) {
        SlotObject* next = counter->dispatchWithParameter(c, "increment", counter);
        next->assignParentSlot(c, "traits", c->space->numberTraits);
        counter = next;
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "Increment time: " << diff.count() << " s" << std::endl;
    std::cout << "Objects in space: " << c->space->getHeapSize() << std::endl;

    // --- Verification ---
    long long checksum = counter->getPrimitive().asLong();
    if (checksum != num_iterations) {
        std::cerr << "Checksum mismatch! Got " << checksum << ", expected " << num_iterations << std::endl;
    } else {
        std::cout << "Checksum verified." << std::endl;
    }

    std::cout << "--------------------------" << std::endl;
    return SLOT_NONE;
}

int main(int argc, char* argv[]) {
    slot::SlotSpace space;
    benchmarks(space.rootContext, nullptr, nullptr);
    return 0;
}
