/*
 * SlotSpace.cpp
 *
 *  Created on: 2026-10-13
 */

#include "../headers/slot_internal.h"
#include <iostream>

namespace slot
{
    SpaceExhaustedError::SpaceExhaustedError(unsigned long heapSize) :
        std::runtime_error("Object space exhausted (" + std::to_string(heapSize) + " objects).")
    {
    }

    SlotSpace::SlotSpace() :
        literalParameter(LITERAL_PARAMETER),
        messageNotFoundCallback(nullptr),
        outOfMemoryCallback(nullptr),
        maxHeapSize(0),
        maxEvaluationDepth(DEFAULT_MAX_EVALUATION_DEPTH),
        logLevel(SLOT_LOG_ERROR),
        logStream(&std::cerr),
        rootContext(nullptr)
    {
        this->rootContext = new SlotContext(this);
        installBuiltinTraits(this->rootContext);
    }

    SlotSpace::~SlotSpace()
    {
        delete this->rootContext;
    }

    /**
     * @brief Allocates a new, empty object owned by this space.
     * Once maxHeapSize objects exist the host is notified through
     * outOfMemoryCallback and SpaceExhaustedError is thrown.
     */
    SlotObject* SlotSpace::allocObject(SlotContext* context)
    {
        if (this->maxHeapSize && this->heap.size() >= this->maxHeapSize) {
            if (this->isLogging(SLOT_LOG_ERROR))
                this->log(SLOT_LOG_ERROR, "object space exhausted: " + std::to_string(this->heap.size()) + " objects");
            if (this->outOfMemoryCallback)
                this->outOfMemoryCallback(context);
            throw SpaceExhaustedError(this->heap.size());
        }

        this->heap.push_back(std::unique_ptr<SlotObject>(new SlotObject()));
        return this->heap.back().get();
    }

    bool SlotSpace::isLogging(int level) const
    {
        return this->logStream && level != SLOT_LOG_NONE && level <= this->logLevel;
    }

    void SlotSpace::log(int level, const std::string& line) const
    {
        if (!this->isLogging(level))
            return;
        *this->logStream << (level == SLOT_LOG_ERROR ? "ERROR: " : "DEBUG: ") << line << std::endl;
    }
}
