/*
 * Builtins.cpp
 *
 *  Created on: 2026-10-14
 *
 *  Native methods of the builtin trait objects. Every method acts on the
 *  primitive of the object bound to the "parameter" slot and answers a new
 *  boxed value.
 */

#include "../headers/slot_internal.h"
#include <climits>

namespace slot
{
    namespace
    {
        const Primitive& numericParameter(const char* method, const SlotObject* parameter)
        {
            if (!parameter)
                throw std::invalid_argument(std::string(method) + ": missing parameter.");
            if (!parameter->getPrimitive().isNumber())
                throw std::invalid_argument(std::string(method) + ": parameter is not a numeric type.");
            return parameter->getPrimitive();
        }

        SlotObject* numberIncrement(SlotContext* context, SlotObject* self, SlotObject* parameter)
        {
            const Primitive& value = numericParameter("increment", parameter);
            if (value.isDouble())
                return context->fromDouble(value.asDouble() + 1.0);
            if (value.asLong() == LLONG_MAX)
                throw std::overflow_error("increment: integer overflow.");
            return context->fromInteger(value.asLong() + 1);
        }

        SlotObject* numberDecrement(SlotContext* context, SlotObject* self, SlotObject* parameter)
        {
            const Primitive& value = numericParameter("decrement", parameter);
            if (value.isDouble())
                return context->fromDouble(value.asDouble() - 1.0);
            if (value.asLong() == LLONG_MIN)
                throw std::overflow_error("decrement: integer overflow.");
            return context->fromInteger(value.asLong() - 1);
        }

        SlotObject* numberNegate(SlotContext* context, SlotObject* self, SlotObject* parameter)
        {
            const Primitive& value = numericParameter("negate", parameter);
            if (value.isDouble())
                return context->fromDouble(-value.asDouble());
            if (value.asLong() == LLONG_MIN)
                throw std::overflow_error("negate: integer overflow.");
            return context->fromInteger(-value.asLong());
        }

        SlotObject* numberAbs(SlotContext* context, SlotObject* self, SlotObject* parameter)
        {
            const Primitive& value = numericParameter("abs", parameter);
            if (value.isDouble()) {
                double d = value.asDouble();
                return context->fromDouble(d < 0 ? -d : d);
            }
            long long l = value.asLong();
            if (l == LLONG_MIN)
                throw std::overflow_error("abs: integer overflow.");
            return context->fromInteger(l < 0 ? -l : l);
        }

        SlotObject* numberIsZero(SlotContext* context, SlotObject* self, SlotObject* parameter)
        {
            const Primitive& value = numericParameter("isZero", parameter);
            if (value.isDouble())
                return context->fromBoolean(value.asDouble() == 0.0);
            return context->fromBoolean(value.asLong() == 0);
        }

        SlotObject* booleanNot(SlotContext* context, SlotObject* self, SlotObject* parameter)
        {
            if (!parameter)
                throw std::invalid_argument("not: missing parameter.");
            if (!parameter->getPrimitive().isBoolean())
                throw std::invalid_argument("not: parameter is not a boolean type.");
            return context->fromBoolean(!parameter->getPrimitive().asBoolean());
        }
    }

    void installBuiltinTraits(SlotContext* context)
    {
        SlotSpace* space = context->space;

        space->numberTraits = context->newObject();
        space->numberTraits->assignSlot(context, "increment", context->fromMethod(numberIncrement));
        space->numberTraits->assignSlot(context, "decrement", context->fromMethod(numberDecrement));
        space->numberTraits->assignSlot(context, "negate", context->fromMethod(numberNegate));
        space->numberTraits->assignSlot(context, "abs", context->fromMethod(numberAbs));
        space->numberTraits->assignSlot(context, "isZero", context->fromMethod(numberIsZero));

        space->booleanTraits = context->newObject();
        space->booleanTraits->assignSlot(context, "not", context->fromMethod(booleanNot));
    }
}
