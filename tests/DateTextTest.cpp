#include <gtest/gtest.h>

#include "DateText.h"
#include "Errors.h"

TEST(DateTextTest, BlankTextIsNoDate) {
    EXPECT_FALSE(parseOptionalDate("", "Due date").isValid());
    EXPECT_FALSE(parseOptionalDate("   ", "Due date").isValid());
}

TEST(DateTextTest, IsoDateParses) {
    EXPECT_EQ(parseOptionalDate(" 2024-05-17 ", "Due date"), QDate(2024, 5, 17));
}

TEST(DateTextTest, MalformedDateIsRejected) {
    EXPECT_THROW(parseOptionalDate("2024/05/17", "Due date"), ValidationError);
    EXPECT_THROW(parseOptionalDate("17.05.2024", "Due date"), ValidationError);
    EXPECT_THROW(parseOptionalDate("2024-02-30", "Due date"), ValidationError);
    EXPECT_THROW(parseOptionalDate("soon", "Due date"), ValidationError);
}

TEST(DateTextTest, MessageNamesFieldAndText) {
    try {
        parseOptionalDate("2024/05/17", "Due date");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError &e) {
        EXPECT_TRUE(e.message().contains("Due date"));
        EXPECT_TRUE(e.message().contains("2024/05/17"));
    }
}
