/*
 * SlotObject.cpp
 *
 *  Created on: 2026-10-12
 *
 *  This file implements the object representation: slots, parent markers,
 *  message sequence and payloads, together with the copy operator, the
 *  mutation API and the diagnostic formatter.
 */

#include "../headers/slot_internal.h"
#include <algorithm>
#include <sstream>

namespace slot
{
    /**
     * @class SlotObject
     * @brief The only node type of an object graph.
     *
     * An object carries named slots, the subset of slot names searched on a
     * lookup miss (its parents), an optional message chain, an optional
     * primitive value and an optional native method. Which of them drives
     * evaluation is decided by getKind().
     */

    SlotObject::SlotObject()
    {
    }

    /**
     * @brief Shallow copy.
     * The slot table, parent set and message sequence are new containers;
     * the objects they reference and the payloads are shared with the source.
     */
    SlotObject* SlotObject::copy(SlotContext* context) const
    {
        SlotObject* newObject = context->newObject();
        newObject->slots = this->slots;
        newObject->parents = this->parents;
        newObject->messages = this->messages;
        newObject->primitive = this->primitive;
        newObject->nativeMethod = this->nativeMethod;
        return newObject;
    }

    /**
     * @brief Creates an empty object inheriting from this one through a
     * single parent slot.
     */
    SlotObject* SlotObject::newChild(SlotContext* context, const std::string& parentName)
    {
        SlotObject* child = context->newObject();
        child->assignParentSlot(context, parentName, this);
        return child;
    }

    int SlotObject::getKind() const
    {
        if (!this->primitive.isNone())
            return OBJECT_KIND_PRIMITIVE;
        if (this->nativeMethod)
            return OBJECT_KIND_NATIVE;
        if (!this->messages.empty())
            return OBJECT_KIND_MESSAGES;
        return OBJECT_KIND_PLAIN;
    }

    //=========================================================================
    // Mutation API
    //=========================================================================

    void SlotObject::assignSlot(SlotContext* context, const std::string& name, SlotObject* value)
    {
        this->slots.setAt(name, value);
    }

    /**
     * @brief Marks an existing slot as a parent. A name without a slot is
     * ignored, and marking twice keeps the first position.
     */
    void SlotObject::makeParent(SlotContext* context, const std::string& name)
    {
        if (!this->hasOwnSlot(name)) {
            if (context->space->isLogging(SLOT_LOG_DEBUG))
                context->space->log(SLOT_LOG_DEBUG, "makeParent ignored obj=" + handleToString(this) + " name=" + name);
            return;
        }
        if (!this->isParent(name))
            this->parents.push_back(name);
    }

    void SlotObject::assignParentSlot(SlotContext* context, const std::string& name, SlotObject* value)
    {
        this->assignSlot(context, name, value);
        this->makeParent(context, name);
    }

    void SlotObject::setPrimitive(const Primitive& value)
    {
        this->primitive = value;
    }

    void SlotObject::setNativeMethod(std::shared_ptr<const NativeMethod> method)
    {
        this->nativeMethod = std::move(method);
    }

    void SlotObject::appendMessage(const std::string& name)
    {
        this->messages.push_back(name);
    }

    void SlotObject::setMessages(const std::vector<std::string>& names)
    {
        this->messages = names;
    }

    //=========================================================================
    // Accessors
    //=========================================================================

    SlotObject* SlotObject::getSlot(const std::string& name) const
    {
        return this->slots.getAt(name);
    }

    // A slot holding SLOT_NONE counts as absent.
    bool SlotObject::hasOwnSlot(const std::string& name) const
    {
        return this->slots.getAt(name) != SLOT_NONE;
    }

    std::vector<std::string> SlotObject::getSlotNames() const
    {
        return this->slots.getNames();
    }

    bool SlotObject::isParent(const std::string& name) const
    {
        return std::find(this->parents.begin(), this->parents.end(), name) != this->parents.end();
    }

    //=========================================================================
    // Diagnostics
    //=========================================================================

    namespace
    {
        void joinNames(std::ostringstream& out, const std::vector<std::string>& names)
        {
            for (unsigned long i = 0; i < names.size(); ++i) {
                if (i > 0)
                    out << ", ";
                out << names[i];
            }
        }
    }

    std::string SlotObject::describe(SlotContext* context) const
    {
        std::ostringstream out;
        out << "SlotObject(primitive: " << this->primitive.toString();
        out << ", slots: {";
        joinNames(out, this->slots.getNames());
        out << "}, parents: {";
        joinNames(out, this->parents);
        out << "}, messages: [";
        joinNames(out, this->messages);
        out << "], native: " << (this->nativeMethod ? "yes" : "no") << ")";
        return out.str();
    }
}
