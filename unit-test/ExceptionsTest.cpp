#include <sstream>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace engine;

static void load_broken_config() {
    throw configuration_error("Unsupported language: brainfuck");
}

TEST(ExceptionsTest, PrintsMessage) {
    try {
        load_broken_config();
        FAIL() << "configuration_error expected";
    } catch (engine_exception &ex) {
        EXPECT_STREQ(ex.what(), "Unsupported language: brainfuck");
        ostringstream os;
        os << ex;
        string report = os.str();
        EXPECT_NE(report.find("Unsupported language: brainfuck"), string::npos) << report;
    }
}

TEST(ExceptionsTest, CopiedExceptionKeepsStacktrace) {
    database_error original("No task status record with id 1");
    database_error copy = original;
    ostringstream lhs, rhs;
    lhs << original;
    rhs << copy;
    EXPECT_EQ(lhs.str(), rhs.str());
}
