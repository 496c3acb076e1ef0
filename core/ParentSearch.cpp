/*
 * ParentSearch.cpp
 *
 *  Created on: 2026-10-13
 *
 *  This file implements inheritance resolution: the breadth-first walk over
 *  parent slots and the message dispatch operations built on it.
 */

#include "../headers/slot_internal.h"

namespace slot
{
    /**
     * @brief Starts a search whose first level is the receiver's parents.
     * The receiver itself is not marked visited; a cycle leading back to it
     * visits it once as an ordinary ancestor.
     */
    ParentSearch::ParentSearch(SlotContext* context, const SlotObject* receiver)
    {
        this->enqueueParents(receiver);
    }

    void ParentSearch::enqueueParents(const SlotObject* object)
    {
        for (const auto& parentName : object->getParentNames())
            this->queue.push_back(object->getSlot(parentName));
    }

    const SlotObject* ParentSearch::next()
    {
        while (!this->queue.empty()) {
            const SlotObject* current = this->queue.front();
            this->queue.pop_front();

            if (!current || this->visited.count(current))
                continue;
            this->visited.insert(current);

            // Level order: this node's parents go behind every node already
            // queued.
            this->enqueueParents(current);
            return current;
        }
        return SLOT_NONE;
    }

    const SlotObject* ParentSearch::findHolder(SlotContext* context, const SlotObject* receiver, const std::string& name)
    {
        if (receiver->hasOwnSlot(name))
            return receiver;

        ParentSearch search(context, receiver);
        while (const SlotObject* current = search.next()) {
            if (current->hasOwnSlot(name))
                return current;
        }
        return SLOT_NONE;
    }

    //=========================================================================
    // SlotObject lookup and dispatch
    //=========================================================================

    SlotObject* SlotObject::lookup(SlotContext* context, const std::string& name) const
    {
        const SlotObject* holder = ParentSearch::findHolder(context, this, name);
        if (!holder)
            return SLOT_NONE;
        return holder->getSlot(name);
    }

    bool SlotObject::hasSlot(SlotContext* context, const std::string& name) const
    {
        return this->lookup(context, name) != SLOT_NONE;
    }

    bool SlotObject::inheritsFrom(SlotContext* context, const SlotObject* ancestor) const
    {
        if (!ancestor)
            return false;

        ParentSearch search(context, this);
        while (const SlotObject* current = search.next()) {
            if (current == ancestor)
                return true;
        }
        return false;
    }

    /**
     * @brief Sends @p name to this object.
     * @return The evaluation of the first matching slot, or SLOT_NONE when
     *         neither this object nor any ancestor defines it.
     */
    SlotObject* SlotObject::dispatch(SlotContext* context, const std::string& name) const
    {
        SlotObject* target = this->lookup(context, name);
        if (context->space->isLogging(SLOT_LOG_DEBUG))
            context->space->log(SLOT_LOG_DEBUG, "dispatch obj=" + handleToString(this) + " name=" + name +
                                (target ? " hit=" + handleToString(target) : " miss"));
        if (!target)
            return SLOT_NONE;
        return target->evaluate(context);
    }

    /**
     * @brief Sends @p name with an argument.
     * The matching slot's object is copied and the copy receives the
     * parameter binding, so the shared prototype behind the slot is left
     * untouched.
     */
    SlotObject* SlotObject::dispatchWithParameter(SlotContext* context, const std::string& name, SlotObject* parameter) const
    {
        SlotObject* target = this->lookup(context, name);
        if (context->space->isLogging(SLOT_LOG_DEBUG))
            context->space->log(SLOT_LOG_DEBUG, "dispatchWithParameter obj=" + handleToString(this) + " name=" + name +
                                (target ? " hit=" + handleToString(target) : " miss"));
        if (!target)
            return SLOT_NONE;

        SlotObject* bound = target->copy(context);
        bound->assignSlot(context, context->space->literalParameter, parameter);
        return bound->evaluate(context);
    }
}
