/*
 * SlotContext.cpp
 *
 *  Created on: 2026-10-13
 *
 *  This file implements the SlotContext: the evaluation state of a caller
 *  and the factory methods that allocate objects in its space.
 */

#include "../headers/slot_internal.h"

namespace slot
{
    /**
     * @brief Constructs a new context. A nested context shares the space of
     * its caller and starts at the caller's evaluation depth.
     */
    SlotContext::SlotContext(
        SlotSpace* space,
        SlotContext* previous
    ) : previous(previous),
        space(space),
        evaluationDepth(0),
        allocatedObjectsCount(0)
    {
        if (previous) {
            this->space = previous->space;
            this->evaluationDepth = previous->evaluationDepth;
        }
        if (!this->space)
            throw std::invalid_argument("SlotContext requires a space.");
    }

    SlotContext::~SlotContext()
    {
    }

    //=========================================================================
    // Factory methods
    //=========================================================================

    SlotObject* SlotContext::newObject()
    {
        SlotObject* object = this->space->allocObject(this);
        ++this->allocatedObjectsCount;
        return object;
    }

    SlotObject* SlotContext::fromPrimitive(const Primitive& value)
    {
        SlotObject* object = this->newObject();
        object->setPrimitive(value);
        return object;
    }

    SlotObject* SlotContext::fromInteger(long long value)
    {
        return this->fromPrimitive(Primitive::fromInteger(value));
    }

    SlotObject* SlotContext::fromDouble(double value)
    {
        return this->fromPrimitive(Primitive::fromDouble(value));
    }

    SlotObject* SlotContext::fromBoolean(bool value)
    {
        return this->fromPrimitive(Primitive::fromBoolean(value));
    }

    SlotObject* SlotContext::fromUTF8String(const char* zeroTerminatedUtf8String)
    {
        if (!zeroTerminatedUtf8String)
            throw std::invalid_argument("fromUTF8String requires a string.");
        return this->fromPrimitive(Primitive::fromString(zeroTerminatedUtf8String));
    }

    SlotObject* SlotContext::fromNativeMethod(std::shared_ptr<const NativeMethod> method)
    {
        SlotObject* object = this->newObject();
        object->setNativeMethod(std::move(method));
        return object;
    }

    SlotObject* SlotContext::fromMethod(SlotMethod method)
    {
        return this->fromNativeMethod(std::make_shared<PointerMethod>(method));
    }

    SlotObject* SlotContext::newMessageChain(const std::vector<std::string>& messages)
    {
        SlotObject* object = this->newObject();
        object->setMessages(messages);
        return object;
    }
}
