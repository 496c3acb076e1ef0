#include <gtest/gtest.h>
#include "../headers/slotCore.h"

using namespace slot;

namespace {
    SlotObject* incrementParameter(SlotContext* context, SlotObject* self, SlotObject* parameter) {
        return context->fromInteger(self->getSlot("parameter")->getPrimitive().asLong() + 1);
    }

    SlotObject* echoParameter(SlotContext* context, SlotObject* self, SlotObject* parameter) {
        return context->fromPrimitive(parameter->getPrimitive());
    }
}

class DispatchTest : public ::testing::Test {
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
};

TEST_F(DispatchTest, DirectSlotIsEvaluated) {
    SlotObject* obj = context->newObject();
    SlotObject* value = context->fromInteger(3);
    obj->assignSlot(context, "three", value);

    SlotObject* result = obj->dispatch(context, "three");
    ASSERT_NE(result, SLOT_NONE);
    ASSERT_NE(result, value);
    ASSERT_EQ(result->getPrimitive().asLong(), 3);
}

TEST_F(DispatchTest, PlainSlotIsReturnedByIdentity) {
    SlotObject* obj = context->newObject();
    SlotObject* plain = context->newObject();
    obj->assignSlot(context, "plain", plain);

    ASSERT_EQ(obj->dispatch(context, "plain"), plain);
}

TEST_F(DispatchTest, MissReturnsNone) {
    SlotObject* obj = context->newObject();
    ASSERT_EQ(obj->dispatch(context, "missing"), SLOT_NONE);
    ASSERT_EQ(obj->dispatchWithParameter(context, "missing", context->fromInteger(1)), SLOT_NONE);
}

TEST_F(DispatchTest, OwnSlotShadowsParent) {
    SlotObject* parent = context->newObject();
    parent->assignSlot(context, "x", context->fromInteger(1));

    SlotObject* obj = context->newObject();
    obj->assignParentSlot(context, "parent", parent);
    obj->assignSlot(context, "x", context->fromInteger(2));

    ASSERT_EQ(obj->dispatch(context, "x")->getPrimitive().asLong(), 2);
}

TEST_F(DispatchTest, NonParentSlotsAreNotSearched) {
    SlotObject* holder = context->newObject();
    holder->assignSlot(context, "x", context->fromInteger(1));

    SlotObject* obj = context->newObject();
    obj->assignSlot(context, "notParent", holder);

    ASSERT_EQ(obj->dispatch(context, "x"), SLOT_NONE);
}

TEST_F(DispatchTest, ParameterizedDispatchThreadsValue) {
    SlotObject* n = context->fromInteger(5);
    SlotObject* inc = context->fromMethod(incrementParameter);
    n->assignSlot(context, "increment", inc);

    SlotObject* result = n->dispatchWithParameter(context, "increment", n);
    ASSERT_NE(result, SLOT_NONE);
    ASSERT_EQ(result->getPrimitive().asLong(), 6);
    ASSERT_FALSE(inc->hasOwnSlot("parameter"));
}

TEST_F(DispatchTest, ParameterBindingStaysOnTransientCopy) {
    SlotObject* shared = context->newObject();
    SlotObject* echo = context->fromMethod(echoParameter);
    shared->assignSlot(context, "echo", echo);

    SlotObject* receiver = context->newObject();
    receiver->assignParentSlot(context, "shared", shared);

    SlotObject* first = receiver->dispatchWithParameter(context, "echo", context->fromInteger(1));
    SlotObject* second = receiver->dispatchWithParameter(context, "echo", context->fromInteger(2));

    ASSERT_EQ(first->getPrimitive().asLong(), 1);
    ASSERT_EQ(second->getPrimitive().asLong(), 2);
    ASSERT_FALSE(echo->hasOwnSlot("parameter"));
    ASSERT_FALSE(shared->hasOwnSlot("parameter"));
    ASSERT_FALSE(receiver->hasOwnSlot("parameter"));
}

TEST_F(DispatchTest, ParameterReplacesExistingBindingOnCopyOnly) {
    SlotObject* echo = context->fromMethod(echoParameter);
    SlotObject* preset = context->fromInteger(100);
    echo->assignSlot(context, "parameter", preset);

    SlotObject* receiver = context->newObject();
    receiver->assignSlot(context, "echo", echo);

    ASSERT_EQ(receiver->dispatch(context, "echo")->getPrimitive().asLong(), 100);
    ASSERT_EQ(receiver->dispatchWithParameter(context, "echo", context->fromInteger(7))->getPrimitive().asLong(), 7);
    ASSERT_EQ(echo->getSlot("parameter"), preset);
}

TEST_F(DispatchTest, ConfiguredParameterSlotName) {
    space->literalParameter = "argument";
    SlotObject* echo = context->fromMethod(echoParameter);
    SlotObject* receiver = context->newObject();
    receiver->assignSlot(context, "echo", echo);

    SlotObject* result = receiver->dispatchWithParameter(context, "echo", context->fromInteger(9));
    ASSERT_EQ(result->getPrimitive().asLong(), 9);
}

TEST_F(DispatchTest, LookupDoesNotEvaluate) {
    SlotObject* parent = context->newObject();
    SlotObject* value = context->fromInteger(8);
    parent->assignSlot(context, "v", value);

    SlotObject* obj = context->newObject();
    obj->assignParentSlot(context, "parent", parent);

    ASSERT_EQ(obj->lookup(context, "v"), value);
    ASSERT_TRUE(obj->hasSlot(context, "v"));
    ASSERT_FALSE(obj->hasOwnSlot("v"));
    ASSERT_FALSE(obj->hasSlot(context, "w"));
}
