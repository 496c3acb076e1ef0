/*
 * slot_internal.h
 *
 *  Created on: October 2026
 */

#ifndef SLOT_INTERNAL_H
#define SLOT_INTERNAL_H

#include "slotCore.h"
#include <deque>
#include <sstream>
#include <string>
#include <unordered_set>

#define DEFAULT_MAX_EVALUATION_DEPTH 2048
#define LITERAL_PARAMETER "parameter"

namespace slot
{
    /**
     * @brief Breadth-first walk over the parent edges of an object graph.
     *
     * The queue starts with the objects behind the receiver's parent slots
     * and grows level by level, each object contributing its own parents in
     * declaration order. Objects are visited at most once, so shared and
     * cyclic ancestries terminate.
     */
    class ParentSearch
    {
    public:
        ParentSearch(SlotContext* context, const SlotObject* receiver);

        //! Next unvisited ancestor, or SLOT_NONE when the graph is exhausted.
        const SlotObject* next();
        unsigned long getVisitedCount() const { return visited.size(); }

        //! Slot holder for @p name: the receiver itself, else the nearest ancestor.
        static const SlotObject* findHolder(SlotContext* context, const SlotObject* receiver, const std::string& name);

    private:
        void enqueueParents(const SlotObject* object);

        std::deque<const SlotObject*> queue;
        std::unordered_set<const SlotObject*> visited;
    };

    /**
     * @brief Scoped increment of SlotContext::evaluationDepth.
     * Throws EvaluationDepthError once the space limit is crossed.
     */
    class EvaluationDepthGuard
    {
    public:
        explicit EvaluationDepthGuard(SlotContext* context);
        ~EvaluationDepthGuard();

        EvaluationDepthGuard(const EvaluationDepthGuard&) = delete;
        EvaluationDepthGuard& operator=(const EvaluationDepthGuard&) = delete;

    private:
        SlotContext* context;
    };

    //! Creates the builtin trait objects of a freshly built space.
    void installBuiltinTraits(SlotContext* context);

    //! Printable handle for log lines.
    inline std::string handleToString(const void* handle)
    {
        std::ostringstream out;
        out << handle;
        return out.str();
    }
}

#endif //SLOT_INTERNAL_H
