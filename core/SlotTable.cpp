/*
 * SlotTable.cpp
 *
 *  Created on: 2026-10-12
 */

#include "../headers/slot_internal.h"

namespace slot
{
    bool SlotTable::has(const std::string& name) const
    {
        return this->index.find(name) != this->index.end();
    }

    SlotObject* SlotTable::getAt(const std::string& name) const
    {
        auto it = this->index.find(name);
        if (it == this->index.end())
            return SLOT_NONE;
        return this->entries[it->second].second;
    }

    /**
     * @brief Sets or overwrites a slot. An overwritten slot keeps its
     * original position in the insertion order.
     */
    void SlotTable::setAt(const std::string& name, SlotObject* value)
    {
        auto it = this->index.find(name);
        if (it != this->index.end()) {
            this->entries[it->second].second = value;
            return;
        }
        this->index.emplace(name, this->entries.size());
        this->entries.emplace_back(name, value);
    }

    std::vector<std::string> SlotTable::getNames() const
    {
        std::vector<std::string> names;
        names.reserve(this->entries.size());
        for (const auto& entry : this->entries)
            names.push_back(entry.first);
        return names;
    }
}
