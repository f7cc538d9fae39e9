#include <gtest/gtest.h>
#include "datatypes/potato_datatype_list.hpp"
#include "potato_utils.hpp"

using namespace potato;

class ListItemTest : public ::testing::Test {
protected:
    void SetUp() override {
        expire_ = Utils::getCurrentTime() + std::chrono::seconds(60);
    }

    Timestamp expire_;
};

// 新列表只含第一个元素
TEST_F(ListItemTest, CreatedWithFirstElement) {
    ListItem item("a", expire_);
    EXPECT_EQ(item.getType(), DataType::LIST);
    ASSERT_EQ(item.size(), 1u);

    Value value;
    EXPECT_EQ(item.getContent("0", value), StatusCode::OK);
    EXPECT_EQ(value, "a");
}

// "-1" 追加到尾部
TEST_F(ListItemTest, AppendSelector) {
    ListItem item("a", expire_);
    EXPECT_EQ(item.setContent("b", LIST_APPEND_SELECTOR), StatusCode::OK);
    EXPECT_EQ(item.setContent("c", "-1"), StatusCode::OK);
    ASSERT_EQ(item.size(), 3u);

    const auto& elements = item.elements();
    EXPECT_EQ(elements[0], "a");
    EXPECT_EQ(elements[1], "b");
    EXPECT_EQ(elements[2], "c");
}

// 按下标覆盖
TEST_F(ListItemTest, OverwriteByIndex) {
    ListItem item("a", expire_);
    item.append("b");
    EXPECT_EQ(item.setContent("B", "1"), StatusCode::OK);

    Value value;
    EXPECT_EQ(item.getContent("1", value), StatusCode::OK);
    EXPECT_EQ(value, "B");
    EXPECT_EQ(item.size(), 2u);
}

// 越界与非法下标
TEST_F(ListItemTest, BadIndex) {
    ListItem item("a", expire_);
    Value value = "untouched";

    EXPECT_EQ(item.getContent("1", value), StatusCode::WRONG_ARGUMENTS);
    EXPECT_EQ(item.getContent("-1", value), StatusCode::WRONG_ARGUMENTS);
    EXPECT_EQ(item.getContent("abc", value), StatusCode::WRONG_ARGUMENTS);
    EXPECT_EQ(item.getContent("", value), StatusCode::WRONG_ARGUMENTS);
    EXPECT_EQ(item.getContent("1x", value), StatusCode::WRONG_ARGUMENTS);
    EXPECT_EQ(item.getContent("-2", value), StatusCode::WRONG_ARGUMENTS);
    EXPECT_EQ(item.getContent("99999999999999999999999", value), StatusCode::WRONG_ARGUMENTS);
    EXPECT_EQ(value, "untouched");

    EXPECT_EQ(item.setContent("x", "5"), StatusCode::WRONG_ARGUMENTS);
    EXPECT_EQ(item.setContent("x", "-3"), StatusCode::WRONG_ARGUMENTS);
    EXPECT_EQ(item.setContent("x", "one"), StatusCode::WRONG_ARGUMENTS);
    EXPECT_EQ(item.size(), 1u);
}
