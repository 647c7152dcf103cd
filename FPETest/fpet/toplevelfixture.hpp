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

/*! \file fpet/toplevelfixture.hpp
    \brief Fixture that can be used at top level
*/

#pragma once

#include <boost/test/unit_test.hpp>
#include <fpe/utilities/log.hpp>
#include <ql/settings.hpp>

using QuantLib::SavedSettings;

namespace fpe {
namespace test {

//! Top level fixture
class TopLevelFixture {
public:
    SavedSettings savedSettings;

    /*! Constructor
        Add things here that you want to happen at the start of every test case
    */
    TopLevelFixture()
        : logEnabled_(fpe::engine::Log::instance().enabled()), logMask_(fpe::engine::Log::instance().mask()) {}

    /*! Destructor
        Add things here that you want to happen after _every_ test case
    */
    virtual ~TopLevelFixture() {
        // Remove a buffer logger that a test case has registered and restore the log state
        fpe::engine::Log& log = fpe::engine::Log::instance();
        if (log.hasLogger(fpe::engine::BufferLogger::name))
            log.removeLogger(fpe::engine::BufferLogger::name);
        log.setMask(logMask_);
        if (logEnabled_)
            log.switchOn();
        else
            log.switchOff();
    }

private:
    bool logEnabled_;
    unsigned logMask_;
};

} // namespace test
} // namespace fpe
