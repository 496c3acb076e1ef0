/*
 * NativeMethod.cpp
 *
 *  Created on: 2026-10-13
 */

#include "../headers/slot_internal.h"

namespace slot
{
    // --- PointerMethod ---

    PointerMethod::PointerMethod(SlotMethod method) :
        method(method)
    {
        if (!method)
            throw std::invalid_argument("PointerMethod requires a method.");
    }

    SlotObject* PointerMethod::compute(SlotContext* context, SlotObject* self, SlotObject* parameter) const
    {
        return this->method(context, self, parameter);
    }

} // namespace slot
