#include <gtest/gtest.h>
#include "../headers/slotCore.h"
#include <climits>

using namespace slot;

class PrimitivesTest : public ::testing::Test {
protected:
    slot::SlotSpace* space;
    slot::SlotContext* context;

    void SetUp() override {
        space = new slot::SlotSpace();
        context = space->rootContext;
    }

    void TearDown() override {
        delete space;
    }

    SlotObject* withTraits(SlotObject* value, SlotObject* traits) {
        value->assignParentSlot(context, "traits", traits);
        return value;
    }
};

TEST_F(PrimitivesTest, IntegerHandling) {
    Primitive i = Primitive::fromInteger(42);
    ASSERT_TRUE(i.isInteger());
    ASSERT_TRUE(i.isNumber());
    ASSERT_EQ(i.asLong(), 42);
    ASSERT_DOUBLE_EQ(i.asDouble(), 42.0);
    ASSERT_EQ(i.toString(), "42");
    ASSERT_THROW(i.asBoolean(), std::runtime_error);
}

TEST_F(PrimitivesTest, DoubleHandling) {
    Primitive d = Primitive::fromDouble(2.5);
    ASSERT_TRUE(d.isDouble());
    ASSERT_DOUBLE_EQ(d.asDouble(), 2.5);
    ASSERT_EQ(d.toString(), "2.5");
    ASSERT_THROW(d.asLong(), std::runtime_error);
}

TEST_F(PrimitivesTest, BooleanHandling) {
    ASSERT_TRUE(Primitive::fromBoolean(true).asBoolean());
    ASSERT_FALSE(Primitive::fromBoolean(false).asBoolean());
    ASSERT_EQ(Primitive::fromBoolean(false).toString(), "false");
}

TEST_F(PrimitivesTest, StringHandling) {
    SlotObject* s = context->fromUTF8String("hello");
    ASSERT_TRUE(s->getPrimitive().isString());
    ASSERT_EQ(s->getPrimitive().asString(), "hello");
    ASSERT_THROW(s->getPrimitive().asDouble(), std::runtime_error);
}

TEST_F(PrimitivesTest, NoneHandling) {
    Primitive none;
    ASSERT_TRUE(none.isNone());
    ASSERT_FALSE(none.isNumber());
    ASSERT_EQ(none.toString(), "none");
}

TEST_F(PrimitivesTest, Equality) {
    ASSERT_TRUE(Primitive::fromInteger(1) == Primitive::fromInteger(1));
    ASSERT_TRUE(Primitive::fromInteger(1) != Primitive::fromDouble(1.0));
    ASSERT_TRUE(Primitive::fromString("a") != Primitive::fromString("b"));
    ASSERT_TRUE(Primitive() == Primitive());
}

TEST_F(PrimitivesTest, IncrementThroughTraits) {
    SlotObject* n = withTraits(context->fromInteger(5), space->numberTraits);
    SlotObject* result = n->dispatchWithParameter(context, "increment", n);

    ASSERT_NE(result, SLOT_NONE);
    ASSERT_EQ(result->getPrimitive().asLong(), 6);
    ASSERT_EQ(n->getPrimitive().asLong(), 5);
}

TEST_F(PrimitivesTest, NumberTraits) {
    SlotObject* n = withTraits(context->fromInteger(-3), space->numberTraits);
    SlotObject* d = withTraits(context->fromDouble(-1.5), space->numberTraits);
    SlotObject* zero = context->fromInteger(0);

    ASSERT_EQ(n->dispatchWithParameter(context, "decrement", n)->getPrimitive().asLong(), -4);
    ASSERT_EQ(n->dispatchWithParameter(context, "negate", n)->getPrimitive().asLong(), 3);
    ASSERT_EQ(n->dispatchWithParameter(context, "abs", n)->getPrimitive().asLong(), 3);
    ASSERT_FALSE(n->dispatchWithParameter(context, "isZero", n)->getPrimitive().asBoolean());
    ASSERT_TRUE(n->dispatchWithParameter(context, "isZero", zero)->getPrimitive().asBoolean());

    ASSERT_DOUBLE_EQ(d->dispatchWithParameter(context, "increment", d)->getPrimitive().asDouble(), -0.5);
    ASSERT_DOUBLE_EQ(d->dispatchWithParameter(context, "abs", d)->getPrimitive().asDouble(), 1.5);
    ASSERT_TRUE(d->dispatchWithParameter(context, "negate", d)->getPrimitive().isDouble());
}

TEST_F(PrimitivesTest, NumberTraitsRejectBadParameters) {
    SlotObject* n = withTraits(context->fromInteger(1), space->numberTraits);

    ASSERT_THROW(n->dispatch(context, "increment"), std::invalid_argument);
    ASSERT_THROW(n->dispatchWithParameter(context, "increment", context->fromUTF8String("one")), std::invalid_argument);
    ASSERT_THROW(n->dispatchWithParameter(context, "increment", context->newObject()), std::invalid_argument);
}

TEST_F(PrimitivesTest, NumberTraitsDetectOverflow) {
    SlotObject* big = withTraits(context->fromInteger(LLONG_MAX), space->numberTraits);
    SlotObject* small = context->fromInteger(LLONG_MIN);

    ASSERT_THROW(big->dispatchWithParameter(context, "increment", big), std::overflow_error);
    ASSERT_THROW(big->dispatchWithParameter(context, "decrement", small), std::overflow_error);
    ASSERT_THROW(big->dispatchWithParameter(context, "negate", small), std::overflow_error);
    ASSERT_THROW(big->dispatchWithParameter(context, "abs", small), std::overflow_error);
}

TEST_F(PrimitivesTest, BooleanTraits) {
    SlotObject* t = withTraits(context->fromBoolean(true), space->booleanTraits);

    ASSERT_FALSE(t->dispatchWithParameter(context, "not", t)->getPrimitive().asBoolean());
    ASSERT_THROW(t->dispatchWithParameter(context, "not", context->fromInteger(1)), std::invalid_argument);
}

TEST_F(PrimitivesTest, TraitsInChain) {
    // A message chain can use a parameterless native that reads a preset
    // parameter slot.
    SlotObject* five = context->fromInteger(5);
    SlotObject* inc = space->numberTraits->getSlot("increment")->copy(context);
    inc->assignSlot(context, "parameter", five);

    SlotObject* root = context->newMessageChain({"next"});
    root->assignSlot(context, "next", inc);

    ASSERT_EQ(root->evaluate(context)->getPrimitive().asLong(), 6);
}
