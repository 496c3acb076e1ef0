/*
 * slotCore
 *
 *  Created on: October, 2026
 */

#ifndef SLOT_H_
#define SLOT_H_

#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace slot
{
    // Forward declarations
    class SlotObject;
    class SlotTable;
    class SlotContext;
    class SlotSpace;
    class Primitive;
    class NativeMethod;

    //! Sentinel for "no object". Raw dispatch returns it on a miss.
    #define SLOT_NONE ((slot::SlotObject*) nullptr)

    #define PRIMITIVE_TYPE_NONE 0
    #define PRIMITIVE_TYPE_INTEGER 1
    #define PRIMITIVE_TYPE_DOUBLE 2
    #define PRIMITIVE_TYPE_BOOLEAN 3
    #define PRIMITIVE_TYPE_STRING 4

    //! Governing kinds, in evaluation priority order.
    #define OBJECT_KIND_PRIMITIVE 0
    #define OBJECT_KIND_NATIVE 1
    #define OBJECT_KIND_MESSAGES 2
    #define OBJECT_KIND_PLAIN 3

    #define SLOT_LOG_NONE 0
    #define SLOT_LOG_ERROR 1
    #define SLOT_LOG_DEBUG 2

    typedef SlotObject*(*SlotMethod)(
        SlotContext* context,
        SlotObject* self,
        SlotObject* parameter
    );

    /**
     * @brief Immutable scalar payload carried by a boxed value.
     */
    class Primitive
    {
    public:
        Primitive();

        static Primitive fromInteger(long long value);
        static Primitive fromDouble(double value);
        static Primitive fromBoolean(bool value);
        static Primitive fromString(const std::string& value);

        int getType() const { return type; }
        bool isNone() const { return type == PRIMITIVE_TYPE_NONE; }
        bool isInteger() const { return type == PRIMITIVE_TYPE_INTEGER; }
        bool isDouble() const { return type == PRIMITIVE_TYPE_DOUBLE; }
        bool isNumber() const { return isInteger() || isDouble(); }
        bool isBoolean() const { return type == PRIMITIVE_TYPE_BOOLEAN; }
        bool isString() const { return type == PRIMITIVE_TYPE_STRING; }

        long long asLong() const;
        double asDouble() const;
        bool asBoolean() const;
        const std::string& asString() const;

        std::string toString() const;

        bool operator==(const Primitive& other) const;
        bool operator!=(const Primitive& other) const { return !(*this == other); }

    private:
        int type;
        long long integerValue;
        double doubleValue;
        bool booleanValue;
        std::string stringValue;
    };

    /**
     * @brief Native computation attached to an object.
     *
     * The evaluator only knows this interface. An implementation may read
     * the slots of @p self, but touches the rest of the graph only through
     * the object it returns.
     */
    class NativeMethod
    {
    public:
        virtual ~NativeMethod() = default;
        virtual SlotObject* compute(SlotContext* context, SlotObject* self, SlotObject* parameter) const = 0;
    };

    /**
     * @brief Adapts a plain SlotMethod function pointer to NativeMethod.
     */
    class PointerMethod final : public NativeMethod
    {
    public:
        explicit PointerMethod(SlotMethod method);
        SlotObject* compute(SlotContext* context, SlotObject* self, SlotObject* parameter) const override;
        SlotMethod getMethod() const { return method; }

    private:
        SlotMethod method;
    };

    /**
     * @brief Name to object mapping that remembers insertion order.
     */
    class SlotTable
    {
    public:
        bool has(const std::string& name) const;
        SlotObject* getAt(const std::string& name) const;
        void setAt(const std::string& name, SlotObject* value);
        unsigned long getSize() const { return entries.size(); }
        std::vector<std::string> getNames() const;

    private:
        std::vector<std::pair<std::string, SlotObject*>> entries;
        std::unordered_map<std::string, unsigned long> index;
    };

    class SlotObject
    {
    public:
        SlotObject();

        //- Object Model
        SlotObject* copy(SlotContext* context) const;
        SlotObject* newChild(SlotContext* context, const std::string& parentName = "parent");
        int getKind() const;

        //- Evaluation
        SlotObject* evaluate(SlotContext* context);

        //- Message Dispatch
        SlotObject* dispatch(SlotContext* context, const std::string& name) const;
        SlotObject* dispatchWithParameter(SlotContext* context, const std::string& name, SlotObject* parameter) const;

        //- Lookup
        SlotObject* lookup(SlotContext* context, const std::string& name) const;
        bool hasSlot(SlotContext* context, const std::string& name) const;
        bool inheritsFrom(SlotContext* context, const SlotObject* ancestor) const;

        //- Mutation
        void assignSlot(SlotContext* context, const std::string& name, SlotObject* value);
        void makeParent(SlotContext* context, const std::string& name);
        void assignParentSlot(SlotContext* context, const std::string& name, SlotObject* value);
        void setPrimitive(const Primitive& value);
        void setNativeMethod(std::shared_ptr<const NativeMethod> method);
        void appendMessage(const std::string& name);
        void setMessages(const std::vector<std::string>& names);

        //- Accessors
        SlotObject* getSlot(const std::string& name) const;
        bool hasOwnSlot(const std::string& name) const;
        std::vector<std::string> getSlotNames() const;
        const std::vector<std::string>& getParentNames() const { return parents; }
        bool isParent(const std::string& name) const;
        const std::vector<std::string>& getMessages() const { return messages; }
        const Primitive& getPrimitive() const { return primitive; }
        bool hasPrimitive() const { return !primitive.isNone(); }
        const std::shared_ptr<const NativeMethod>& getNativeMethod() const { return nativeMethod; }

        //- Diagnostics
        std::string describe(SlotContext* context) const;

    private:
        SlotTable slots;
        std::vector<std::string> parents;
        std::vector<std::string> messages;
        Primitive primitive;
        std::shared_ptr<const NativeMethod> nativeMethod;
    };

    /**
     * @brief Raised when a message of a chain resolves nowhere.
     */
    class MessageNotFoundError : public std::runtime_error
    {
    public:
        explicit MessageNotFoundError(const std::string& messageName);
        const std::string& getMessageName() const { return messageName; }

    private:
        std::string messageName;
    };

    class EvaluationDepthError : public std::runtime_error
    {
    public:
        explicit EvaluationDepthError(unsigned int depth);
    };

    class SpaceExhaustedError : public std::runtime_error
    {
    public:
        explicit SpaceExhaustedError(unsigned long heapSize);
    };

    /**
     * @brief Execution state of one evaluation: the owning space, the
     * calling context and the current evaluation depth.
     */
    class SlotContext
    {
    public:
        explicit SlotContext(SlotSpace* space, SlotContext* previous = nullptr);
        ~SlotContext();

        //- Execution State
        SlotContext* previous;
        SlotSpace* space;
        unsigned int evaluationDepth;

        //- Factory methods for boxed values
        SlotObject* fromInteger(long long value);
        SlotObject* fromDouble(double value);
        SlotObject* fromBoolean(bool value);
        SlotObject* fromUTF8String(const char* zeroTerminatedUtf8String);
        SlotObject* fromPrimitive(const Primitive& value);
        SlotObject* fromMethod(SlotMethod method);
        SlotObject* fromNativeMethod(std::shared_ptr<const NativeMethod> method);

        //- Factory methods for plain objects
        SlotObject* newObject();
        SlotObject* newMessageChain(const std::vector<std::string>& messages);

        //- Memory Management
        unsigned long allocatedObjectsCount;
    };

    /**
     * @brief The arena holding every object of a graph.
     *
     * A SlotSpace owns all objects allocated through its contexts; they are
     * released together when the space is destroyed. It also carries the
     * configuration, host callbacks and the builtin trait objects.
     */
    class SlotSpace
    {
    public:
        explicit SlotSpace();
        ~SlotSpace();

        SlotSpace(const SlotSpace&) = delete;
        SlotSpace& operator=(const SlotSpace&) = delete;

        //- Builtin Traits
        SlotObject* numberTraits{};
        SlotObject* booleanTraits{};

        // --- Cached Literals ---
        std::string literalParameter;

        //- Callbacks
        void (*messageNotFoundCallback)(
            SlotContext* context,
            const SlotObject* receiver,
            const std::string& messageName){};

        void (*outOfMemoryCallback)(
            SlotContext* context){};

        //- Configuration
        unsigned long maxHeapSize;
        unsigned int maxEvaluationDepth;
        int logLevel;
        std::ostream* logStream;

        //- Memory Management
        SlotObject* allocObject(SlotContext* context);
        unsigned long getHeapSize() const { return heap.size(); }

        //- Logging
        bool isLogging(int level) const;
        void log(int level, const std::string& line) const;

        SlotContext* rootContext;

    private:
        std::vector<std::unique_ptr<SlotObject>> heap;
    };
}

#endif /* SLOT_H_ */
