/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <boost/algorithm/string/predicate.hpp>
#include <boost/test/unit_test.hpp>
#include <fpe/periods/structuredperiodmessage.hpp>
#include <fpe/utilities/log.hpp>
#include <fpe/version.hpp>
#include <fpet/log.hpp>
#include <fpet/toplevelfixture.hpp>

using namespace boost::unit_test_framework;
using namespace std;
using namespace fpe::engine;

using fpe::test::BoostTestLogger;
using fpe::test::TestLogOptions;
using fpe::test::TopLevelFixture;

namespace {

// Registers a buffer logger for the test case, the TopLevelFixture removes it again
class LogFixture : public TopLevelFixture {
public:
    QuantLib::ext::shared_ptr<BufferLogger> logger;

    LogFixture() : logger(QuantLib::ext::make_shared<BufferLogger>()) {
        if (Log::instance().hasLogger(BufferLogger::name))
            Log::instance().removeLogger(BufferLogger::name);
        Log::instance().registerLogger(logger);
        Log::instance().switchOn();
        Log::instance().setMask(255);
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(FPEngineTestSuite, TopLevelFixture)

BOOST_FIXTURE_TEST_SUITE(LogTests, LogFixture)

BOOST_AUTO_TEST_CASE(testBufferLogger) {

    BOOST_TEST_MESSAGE("Testing the buffer logger...");

    WLOG("first message");
    DLOG("second message " << 2);

    BOOST_CHECK_EQUAL(logger->size(), 2u);
    string first = logger->next();
    BOOST_CHECK(boost::starts_with(first, "WARNING"));
    BOOST_CHECK(boost::ends_with(first, "first message"));
    BOOST_CHECK(boost::contains(first, "log.cpp"));
    BOOST_CHECK(boost::ends_with(logger->next(), "second message 2"));
    BOOST_CHECK(!logger->hasNext());
    BOOST_CHECK_THROW(logger->next(), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testMaskAndSwitch) {

    BOOST_TEST_MESSAGE("Testing the log mask...");

    Log::instance().setMask(FPE_ALERT | FPE_WARNING);
    WLOG("kept");
    DLOG("filtered");
    LOG("filtered");
    BOOST_CHECK_EQUAL(logger->size(), 1u);
    logger->clear();

    Log::instance().switchOff();
    ALOG("not logged");
    BOOST_CHECK(!logger->hasNext());
}

BOOST_AUTO_TEST_CASE(testLoggerRegistry) {

    BOOST_TEST_MESSAGE("Testing logger registration...");

    BOOST_CHECK(Log::instance().hasLogger(BufferLogger::name));
    BOOST_CHECK_THROW(Log::instance().registerLogger(QuantLib::ext::make_shared<BufferLogger>()), QuantLib::Error);
    BOOST_CHECK_THROW(Log::instance().logger("NoSuchLogger"), QuantLib::Error);
    BOOST_CHECK_THROW(Log::instance().removeLogger("NoSuchLogger"), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testStructuredMessages) {

    BOOST_TEST_MESSAGE("Testing structured warnings and configuration errors...");

    StructuredPeriodWarningMessage warning("FloatingPeriod", "Missing historical fixings", "a \"quoted\" text",
                                           {{"dates", "2021-12-31"}, {"empty", ""}});
    BOOST_CHECK(warning.category() == StructuredMessage::Category::Warning);
    BOOST_CHECK(warning.group() == StructuredMessage::Group::Fixing);
    BOOST_CHECK_EQUAL(warning.subFields().size(), 3u);
    BOOST_CHECK_EQUAL(warning.subFields().at("periodType"), "FloatingPeriod");

    string json = warning.json();
    BOOST_CHECK(boost::contains(json, "\"category\":\"Warning\""));
    BOOST_CHECK(boost::contains(json, "\"group\":\"Fixing\""));
    BOOST_CHECK(boost::contains(json, "a \\\"quoted\\\" text"));
    BOOST_CHECK(boost::contains(json, "{ \"name\": \"dates\", \"value\": \"2021-12-31\" }"));

    warning.log();
    string msg = logger->next();
    BOOST_CHECK(boost::starts_with(msg, "WARNING"));
    BOOST_CHECK(boost::contains(msg, "StructuredWarningMessage"));

    StructuredConfigurationErrorMessage error("method_param", "Invalid period configuration", "bad");
    error.log();
    msg = logger->next();
    BOOST_CHECK(boost::starts_with(msg, "ALERT"));
    BOOST_CHECK(boost::contains(msg, "StructuredErrorMessage"));
    BOOST_CHECK(boost::contains(msg, "\"group\":\"Configuration\""));
}

BOOST_AUTO_TEST_CASE(testTestLogOptions) {

    BOOST_TEST_MESSAGE("Testing the logging options of the test executable...");

    char program[] = "fpe-test-suite";
    char level[] = "--log_level=message";
    char mask[] = "--fpe_log_mask=12";
    char defaultMask[] = "--fpe_log_mask";
    char structured[] = "--fpe_log_structured";

    char* none[] = {program, level};
    TestLogOptions options = fpe::test::parseTestLogOptions(2, none);
    BOOST_CHECK(!options.enabled);

    char* withMask[] = {program, level, mask};
    options = fpe::test::parseTestLogOptions(3, withMask);
    BOOST_CHECK(options.enabled);
    BOOST_CHECK_EQUAL(options.mask, 12u);
    BOOST_CHECK(!options.structuredOnly);

    char* withDefaultMask[] = {program, defaultMask};
    options = fpe::test::parseTestLogOptions(2, withDefaultMask);
    BOOST_CHECK(options.enabled);
    BOOST_CHECK_EQUAL(options.mask, 255u);

    char* structuredOnly[] = {program, structured};
    options = fpe::test::parseTestLogOptions(2, structuredOnly);
    BOOST_CHECK(options.enabled);
    BOOST_CHECK(options.structuredOnly);
}

BOOST_AUTO_TEST_CASE(testBoostTestLoggerCountsStructuredMessages) {

    BOOST_TEST_MESSAGE("Testing the structured message counts of the test logger...");

    StructuredPeriodWarningMessage("FloatingPeriod", "Missing historical fixings", "dates are projected",
                                   {{"dates", "2021-12-31"}})
        .log();
    StructuredConfigurationErrorMessage("method_param", "Invalid period configuration", "must be >0").log();
    DLOG("plain message");
    BOOST_REQUIRE_EQUAL(logger->size(), 3u);

    BoostTestLogger testLogger(true);
    testLogger.log(FPE_WARNING, logger->next());
    testLogger.log(FPE_ALERT, logger->next());
    testLogger.log(FPE_DEBUG, logger->next());
    BOOST_CHECK_EQUAL(testLogger.warnings(), 1u);
    BOOST_CHECK_EQUAL(testLogger.errors(), 1u);
    BOOST_CHECK_EQUAL(testLogger.name(), "BoostTestLogger");
}

BOOST_AUTO_TEST_CASE(testBuildInfo) {

    BOOST_TEST_MESSAGE("Testing the version information...");

    BOOST_CHECK_EQUAL(FPE_VERSION_NUM, 1020000);
    string info = buildInfo();
    BOOST_CHECK(boost::starts_with(info, "FPEngine " FPE_VERSION " (QuantLib "));
    BOOST_CHECK(boost::contains(info, QL_VERSION));
    BOOST_CHECK(boost::contains(info, ", Boost 1."));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
