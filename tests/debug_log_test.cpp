#include "debug_log.hpp"
#include "ordered_map.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ordmap {
namespace {

using IntMap = OrderedMap<int, int>;

class DebugLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "ordmap_debug_log_test.log";
        setDebugLogPath(path_);
    }

    void TearDown() override {
        closeDebugLog();
        std::remove(path_.c_str());
    }

    std::string contents() const {
        std::ifstream in(path_);
        std::ostringstream out;
        out << in.rdbuf();
        return out.str();
    }

    std::string path_;
};

TEST_F(DebugLogTest, WritesTaggedLines) {
    EXPECT_TRUE(debugLogEnabled());
    writeDebugLog("test", "hello");
    ORDMAP_DEBUG_LOG("stream", "value " << 42);

    std::string log = contents();
    EXPECT_EQ(log.find("=== ordmap debug log ==="), 0u);
    EXPECT_NE(log.find("[test] hello\n"), std::string::npos);
    EXPECT_NE(log.find("[stream] value 42\n"), std::string::npos);
}

TEST_F(DebugLogTest, RecordsFailedLookups) {
    IntMap m = IntMap::singleton(1, 1);
    EXPECT_THROW(m.findExn(2), std::out_of_range);
    EXPECT_THROW(IntMap().chooseExn(), std::runtime_error);

    std::string log = contents();
    EXPECT_NE(log.find("[findExn] absent key in map of 1 bindings"), std::string::npos);
    EXPECT_NE(log.find("[chooseExn] called on empty map"), std::string::npos);
}

TEST_F(DebugLogTest, ClosedLogSkipsMessages) {
    closeDebugLog();
    EXPECT_FALSE(debugLogEnabled());

    int evaluated = 0;
    ORDMAP_DEBUG_LOG("skipped", ++evaluated);
    writeDebugLog("skipped", "nothing");
    EXPECT_EQ(evaluated, 0);
    EXPECT_EQ(contents().find("[skipped]"), std::string::npos);
}

TEST_F(DebugLogTest, UnopenablePathThrows) {
    EXPECT_THROW(setDebugLogPath(::testing::TempDir() + "no/such/dir/log.txt"), std::runtime_error);
    EXPECT_FALSE(debugLogEnabled());
}

} // namespace
} // namespace ordmap
