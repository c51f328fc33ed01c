#include "seqrt/seq/tests/libseq.hh"

namespace seqrt {

class ValueTest : public LibSeqTest
{};

TEST_F(ValueTest, scalarTypes)
{
    EXPECT_EQ(Value::vNothing.type(), nNothing);
    EXPECT_EQ(Value::fromBool(true).type(), nBool);
    EXPECT_EQ(mkInt(1).type(), nInt);
    EXPECT_EQ(Value::fromFloat(1.5).type(), nFloat);
    EXPECT_EQ(Value::fromString("a").type(), nString);
}

TEST_F(ValueTest, positionalTypesFollowKind)
{
    EXPECT_EQ(intList({1}).type(), nList);
    EXPECT_EQ(intArray({1}).type(), nArray);
    EXPECT_EQ(toSlip(intList({1})).type(), nSlip);
    EXPECT_TRUE(intArray({}).isPositional());
    EXPECT_FALSE(box(intList({1})).isPositional());
}

TEST_F(ValueTest, showType)
{
    EXPECT_EQ(showType(mkInt(1)), "Int");
    EXPECT_EQ(showType(Value::fromString("x")), "Str");
    EXPECT_EQ(showType(box(mkInt(1))), "Container");
    EXPECT_EQ(showType(toSequence(std::make_unique<ValuesIterator>(ValueVector{}))), "Seq");
    EXPECT_EQ(showType(Value()), "an uninitialized value");
}

TEST_F(ValueTest, decontLooksThroughContainers)
{
    auto v = box(mkInt(7));
    EXPECT_THAT(v.decont(), IsIntEq(7));
    EXPECT_THAT(mkInt(7).decont(), IsIntEq(7));
}

TEST_F(ValueTest, sameObject)
{
    auto l = intList({1, 2});
    auto copy = l;
    EXPECT_TRUE(l.sameObject(copy));
    EXPECT_FALSE(l.sameObject(intList({1, 2})));
    EXPECT_FALSE(mkInt(1).sameObject(mkInt(1)));
}

TEST_F(ValueTest, equalsComparesStructurally)
{
    EXPECT_TRUE(valueEquals(intList({1, 2}), intArray({1, 2})));
    EXPECT_FALSE(valueEquals(intList({1, 2}), intList({1, 2, 3})));
    EXPECT_TRUE(valueEquals(box(mkInt(1)), mkInt(1)));
    EXPECT_FALSE(valueEquals(mkInt(1), Value::fromFloat(1.0)));
    EXPECT_TRUE(valueEquals(Value::fromString("ab"), Value::fromString("ab")));
}

TEST_F(ValueTest, lazyPositionalsOnlyEqualThemselves)
{
    auto l = List::fromIterator(ListKind::List, std::make_unique<RangeIterator>(1, std::nullopt))->toValue();
    auto m = List::fromIterator(ListKind::List, std::make_unique<RangeIterator>(1, std::nullopt))->toValue();
    EXPECT_TRUE(valueEquals(l, l));
    EXPECT_FALSE(valueEquals(l, m));
}

TEST_F(ValueTest, uninitializedValuesOnlyEqualEachOther)
{
    Value a, b;
    EXPECT_TRUE(valueEquals(a, b));
    EXPECT_FALSE(valueEquals(a, mkInt(0)));
    EXPECT_FALSE(valueEquals(Value::vNothing, a));
}

TEST_F(ValueTest, isLazy)
{
    auto l = List::fromIterator(ListKind::List, std::make_unique<RangeIterator>(1, std::nullopt))->toValue();
    EXPECT_TRUE(l.isLazy());
    EXPECT_TRUE(box(l).isLazy());
    EXPECT_FALSE(intList({1}).isLazy());
    EXPECT_FALSE(mkInt(1).isLazy());
}

} // namespace seqrt
