#include "edgelog/common/Logger.h"

#include <cassert>
#include <string>

using namespace edgelog::common;

static void testLevelFilter() {
    auto& logger = Logger::Instance();
    logger.SetLevel(LogLevel::WARN);
    int evaluated = 0;
    auto touch = [&evaluated]() { ++evaluated; return "x"; };

    // suppressed statements never evaluate their operands
    LOG_DEBUG << touch();
    LOG_INFO << touch();
    assert(evaluated == 0);
    LOG_WARN << "logger filter check " << touch();
    assert(evaluated == 1);
    logger.SetLevel(LogLevel::INFO);
    LOG_INFO << "Level filter PASS";
}

static void testTrailingElse() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    bool elseTaken = false;
    const bool never = false;
    if (never)
        LOG_DEBUG << "unreachable";
    else
        elseTaken = true;
    assert(elseTaken);

    bool thenTaken = false;
    const bool always = true;
    if (always)
        LOG_DEBUG << "filtered";
    else
        thenTaken = true;
    assert(!thenTaken);
    Logger::Instance().SetLevel(LogLevel::INFO);
    LOG_INFO << "Trailing else PASS";
}

static void testParseLevel() {
    auto& logger = Logger::Instance();
    assert(logger.ParseLevel("DEBUG") == LogLevel::DEBUG);
    assert(logger.ParseLevel("WARN") == LogLevel::WARN);
    assert(logger.ParseLevel("ERROR") == LogLevel::ERROR);
    assert(logger.ParseLevel("bogus") == LogLevel::INFO);
    LOG_INFO << "ParseLevel PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testLevelFilter();
    testTrailingElse();
    testParseLevel();
    return 0;
}
