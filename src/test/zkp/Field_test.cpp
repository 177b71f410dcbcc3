#include "ZkpTestBase.h"

namespace zkframe {
namespace zkp {
namespace test {

namespace {

// Order of the alt_bn128 scalar field.
std::string const modulus =
    "21888242871839275222246405745257275088548364400416034343698204186575808495"
    "617";
std::string const modulusMinusOne =
    "21888242871839275222246405745257275088548364400416034343698204186575808495"
    "616";

}  // namespace

class Field_test : public ZkpTest
{
};

TEST_F(Field_test, parsesDecimalLiterals)
{
    FieldT value;
    ASSERT_TRUE(parseFieldLiteral("0", value));
    EXPECT_EQ(value, FieldT::zero());
    ASSERT_TRUE(parseFieldLiteral("42", value));
    EXPECT_EQ(value, field(42));
    ASSERT_TRUE(parseFieldLiteral("007", value));
    EXPECT_EQ(value, field(7));
}

TEST_F(Field_test, negativeLiteralIsFieldNegation)
{
    FieldT value;
    ASSERT_TRUE(parseFieldLiteral("-1", value));
    EXPECT_EQ(value, -FieldT::one());
    EXPECT_EQ(value + FieldT::one(), FieldT::zero());

    FieldT largest;
    ASSERT_TRUE(parseFieldLiteral(modulusMinusOne, largest));
    EXPECT_EQ(largest, value);
}

TEST_F(Field_test, rejectsMalformedLiterals)
{
    FieldT value;
    for (std::string const text : {"", "-", "1.5", "0x10", "1-2", "+3", "abc"})
        EXPECT_FALSE(parseFieldLiteral(text, value)) << text;
}

TEST_F(Field_test, rejectsLiteralsOutsideTheField)
{
    FieldT value;
    EXPECT_FALSE(parseFieldLiteral(modulus, value));
    EXPECT_FALSE(parseFieldLiteral("-" + modulus, value));
    EXPECT_FALSE(parseFieldLiteral(modulus + "0", value));
}

TEST_F(Field_test, decimalRendering)
{
    EXPECT_EQ(toDecimalString(FieldT::zero()), "0");
    EXPECT_EQ(toDecimalString(field(17)), "17");
    EXPECT_EQ(toDecimalString(-FieldT::one()), modulusMinusOne);
}

TEST_F(Field_test, booleanValues)
{
    EXPECT_TRUE(isBoolean(FieldT::zero()));
    EXPECT_TRUE(isBoolean(FieldT::one()));
    EXPECT_FALSE(isBoolean(field(2)));
    EXPECT_FALSE(isBoolean(-FieldT::one()));
}

}  // namespace test
}  // namespace zkp
}  // namespace zkframe
