#include <gtest/gtest.h>
#include "stepdag/common/payload.hpp"
#include "stepdag/common/payload.inline.hpp"
#include <string>

using namespace stepdag;

// =============================================================================
// Payload Basic Functionality Tests
// =============================================================================

class PayloadTests : public ::testing::Test
{
protected:
    Payload payload;
};

TEST_F(PayloadTests, DefaultConstructed_IsEmpty)
{
    EXPECT_FALSE(payload.has_value());
    EXPECT_EQ(payload.cpp_type(), std::type_index{typeid(void)});
    EXPECT_TRUE(payload.data_type().is_none());
}

TEST_F(PayloadTests, Of_SetsValueAndTypes)
{
    payload = Payload::of(42, DataType::integer());
    EXPECT_TRUE(payload.has_value());
    EXPECT_TRUE(payload.has_type<int>());
    EXPECT_FALSE(payload.has_type<double>());
    EXPECT_EQ(payload.data_type(), DataType::integer());
    EXPECT_EQ(payload.as<int>(), 42);
}

TEST_F(PayloadTests, Of_NamedType)
{
    struct Frame
    {
        int rows;
    };
    payload = Payload::of(Frame{7}, DataType::named("pandas.DataFrame"));
    EXPECT_EQ(payload.as<Frame>().rows, 7);
    EXPECT_EQ(payload.data_type().to_string(), "pandas.DataFrame");
}

TEST_F(PayloadTests, FromJson_DerivesDataType)
{
    payload = Payload::from_json(Json{{"a", 1}});
    EXPECT_TRUE(payload.has_type<Json>());
    EXPECT_EQ(payload.data_type(), DataType::dict());

    payload = Payload::from_json(Json(2.5));
    EXPECT_EQ(payload.data_type(), DataType::floating());
}

TEST_F(PayloadTests, As_EmptyThrows)
{
    EXPECT_THROW(payload.as<int>(), PayloadEmptyError);
}

TEST_F(PayloadTests, As_WrongTypeThrows)
{
    payload = Payload::of(std::string("text"), DataType::string());
    EXPECT_THROW(payload.as<int>(), PayloadTypeError);
}

TEST_F(PayloadTests, TryAs_ReturnsPointerOnMatch)
{
    payload = Payload::of(42, DataType::integer());
    const int* ptr = payload.try_as<int>();
    ASSERT_NE(ptr, nullptr);
    EXPECT_EQ(*ptr, 42);
    EXPECT_EQ(payload.try_as<double>(), nullptr);
}

TEST_F(PayloadTests, Get_SharesOwnership)
{
    payload = Payload::of(std::string("shared"), DataType::string());
    std::shared_ptr<const std::string> ptr = payload.get<std::string>();
    ASSERT_NE(ptr, nullptr);
    payload.reset();
    EXPECT_FALSE(payload.has_value());
    EXPECT_EQ(*ptr, "shared");
}

TEST_F(PayloadTests, Copy_SharesValue)
{
    payload = Payload::of(std::vector<int>{1, 2, 3}, DataType::list());
    Payload copy = payload;
    EXPECT_EQ(&payload.as<std::vector<int>>(), &copy.as<std::vector<int>>());
}

TEST_F(PayloadTests, Reset_ClearsDataType)
{
    payload = Payload::of(1, DataType::integer());
    payload.reset();
    EXPECT_TRUE(payload.data_type().is_none());
    EXPECT_EQ(payload.cpp_type(), std::type_index{typeid(void)});
}
