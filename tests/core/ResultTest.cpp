#include "reclaim/Result.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace reclaim;

TEST(ResultTest, DefaultStatusIsOk) {
    Status st;
    EXPECT_TRUE(st.ok());
    EXPECT_TRUE(static_cast<bool>(st));
    EXPECT_EQ(st.describe(), "ok");
}

TEST(ResultTest, ErrorCarriesCodeAndPath) {
    Status st = makeError(Errc::NotFound, "unit not found", "myapp/0");
    EXPECT_FALSE(st.ok());
    EXPECT_TRUE(st.is(Errc::NotFound));
    EXPECT_FALSE(st.is(Errc::Internal));
    EXPECT_EQ(st.describe(), "myapp/0: unit not found");
    EXPECT_TRUE(isNotFound(st));
}

TEST(ResultTest, AnnotateKeepsCode) {
    Status st = annotate(Status{makeError(Errc::HasSubordinates, "unit has subordinates")}, "setting unit dead");
    EXPECT_TRUE(st.is(Errc::HasSubordinates));
    EXPECT_EQ(st.error().message, "setting unit dead: unit has subordinates");
}

TEST(ResultTest, AnnotateOkIsOk) {
    Status st = annotate(Status{}, "anything");
    EXPECT_TRUE(st.ok());
}

TEST(ResultTest, ResultHoldsValueOrError) {
    Result<int> good(42);
    ASSERT_TRUE(good);
    EXPECT_EQ(*good, 42);
    EXPECT_TRUE(good.status().ok());

    Result<int> bad(makeError(Errc::Unavailable, "store down"));
    EXPECT_FALSE(bad);
    EXPECT_TRUE(bad.is(Errc::Unavailable));
    EXPECT_EQ(bad.error().message, "store down");
    EXPECT_TRUE(bad.status().is(Errc::Unavailable));
}

TEST(ResultTest, ResultArrowAccess) {
    Result<std::string> r(std::string("abc"));
    EXPECT_EQ(r->size(), 3u);
}

TEST(ResultTest, DiagnosticsCollectAndMerge) {
    Diagnostics a;
    EXPECT_TRUE(a.empty());
    a.add(makeError(Errc::Internal, "one"));
    a.add(Status{});  // ok statuses are not recorded
    EXPECT_EQ(a.size(), 1u);

    Diagnostics b;
    b.add(Status{makeError(Errc::TxnAborted, "two", "m/0")});
    a.merge(b);
    ASSERT_EQ(a.size(), 2u);
    EXPECT_EQ(a.errors()[1].code, Errc::TxnAborted);
    EXPECT_EQ(a.describe(), "[one; m/0: two]");
}

TEST(ResultTest, ErrcNames) {
    EXPECT_STREQ(toString(Errc::NotFound), "not found");
    EXPECT_STREQ(toString(Errc::TxnAborted), "transaction aborted");
    EXPECT_STREQ(toString(Errc::UnknownKind), "unknown kind");
}
