/*
 * Evaluate.cpp
 *
 *  Created on: 2026-10-13
 *
 *  This file implements object evaluation and the failures it raises.
 */

#include "../headers/slot_internal.h"

namespace slot
{
    MessageNotFoundError::MessageNotFoundError(const std::string& messageName) :
        std::runtime_error("Message '" + messageName + "' not found"),
        messageName(messageName)
    {
    }

    EvaluationDepthError::EvaluationDepthError(unsigned int depth) :
        std::runtime_error("Evaluation depth limit exceeded (" + std::to_string(depth) + ").")
    {
    }

    EvaluationDepthGuard::EvaluationDepthGuard(SlotContext* context) :
        context(context)
    {
        SlotSpace* space = context->space;
        if (space->maxEvaluationDepth && context->evaluationDepth >= space->maxEvaluationDepth) {
            if (space->isLogging(SLOT_LOG_ERROR))
                space->log(SLOT_LOG_ERROR, "evaluation depth limit reached: " + std::to_string(context->evaluationDepth));
            throw EvaluationDepthError(context->evaluationDepth);
        }
        ++context->evaluationDepth;
    }

    EvaluationDepthGuard::~EvaluationDepthGuard()
    {
        --this->context->evaluationDepth;
    }

    /**
     * @brief Evaluates this object according to its governing kind.
     *
     * - PRIMITIVE: an independent copy carrying the same value.
     * - NATIVE: the native method's result, given this object and its own
     *   "parameter" slot.
     * - MESSAGES: each message is sent to the result of the previous one,
     *   starting from a copy of this object. The first message that resolves
     *   nowhere aborts the whole evaluation with MessageNotFoundError.
     * - PLAIN: this object itself.
     */
    SlotObject* SlotObject::evaluate(SlotContext* context)
    {
        EvaluationDepthGuard guard(context);

        switch (this->getKind())
        {
        case OBJECT_KIND_PRIMITIVE:
            return this->copy(context);

        case OBJECT_KIND_NATIVE:
            return this->nativeMethod->compute(context, this, this->getSlot(context->space->literalParameter));

        case OBJECT_KIND_MESSAGES:
            {
                SlotObject* current = this->copy(context);
                for (const auto& message : this->messages) {
                    SlotObject* next = current->dispatch(context, message);
                    if (!next) {
                        SlotSpace* space = context->space;
                        if (space->isLogging(SLOT_LOG_DEBUG))
                            space->log(SLOT_LOG_DEBUG, "message not found obj=" + handleToString(current) + " name=" + message);
                        if (space->messageNotFoundCallback)
                            space->messageNotFoundCallback(context, current, message);
                        throw MessageNotFoundError(message);
                    }
                    current = next;
                }
                return current;
            }

        default:
            return this;
        }
    }
}
