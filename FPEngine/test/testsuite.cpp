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

/*! \file testsuite.cpp
    \brief wrapper calling all individual test cases
    \ingroup
*/

#include <iomanip>
#include <iostream>

// Boost.Test
#define BOOST_TEST_MODULE "FPEngineTestSuite"
#include <boost/test/included/unit_test.hpp>

// Boost
#include <boost/timer/timer.hpp>
using boost::unit_test::test_suite;
using boost::unit_test::framework::master_test_suite;

#include <fpe/version.hpp>
#include <fpet/log.hpp>
using fpe::test::setupTestLogging;

class FpeGlobalFixture {
public:
    FpeGlobalFixture() {
        int argc = master_test_suite().argc;
        char** argv = master_test_suite().argv;

        // Set up test logging
        logger_ = setupTestLogging(argc, argv);

        BOOST_TEST_MESSAGE(fpe::engine::buildInfo());
    }

    ~FpeGlobalFixture() {
        if (logger_)
            std::cout << std::endl
                      << logger_->warnings() << " structured warnings and " << logger_->errors()
                      << " structured errors logged" << std::endl;
        stopTimer();
    }

    // Method called in destructor to log time taken
    void stopTimer() {
        double seconds = t.elapsed().wall * 1e-9;
        int hours = int(seconds / 3600);
        seconds -= hours * 3600;
        int minutes = int(seconds / 60);
        seconds -= minutes * 60;
        std::cout << std::endl << "FPEngine tests completed in ";
        if (hours > 0)
            std::cout << hours << " h ";
        if (hours > 0 || minutes > 0)
            std::cout << minutes << " m ";
        std::cout << std::fixed << std::setprecision(0) << seconds << " s" << std::endl;
    }

private:
    // Timing the test run
    boost::timer::cpu_timer t;
    QuantLib::ext::shared_ptr<fpe::test::BoostTestLogger> logger_;
};

BOOST_TEST_GLOBAL_FIXTURE(FpeGlobalFixture);
