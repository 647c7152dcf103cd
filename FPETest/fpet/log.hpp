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

/*! \file fpet/log.hpp
    \brief Routing of the engine log into the Boost.Test log
*/

#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/test/unit_test.hpp>
#include <fpe/utilities/log.hpp>

#include <string>

namespace fpe {
namespace test {

//! Logging options of the test executable
/*! - `--fpe_log_mask[=mask]` turns on the engine log, the mask defaults to 255
    - `--fpe_log_structured` turns on the engine log and keeps only structured warnings and errors
*/
struct TestLogOptions {
    TestLogOptions() : enabled(false), mask(255), structuredOnly(false) {}
    bool enabled;
    unsigned int mask;
    bool structuredOnly;
};

//! Parse the logging options from the command line of the test executable, unknown arguments are ignored
inline TestLogOptions parseTestLogOptions(int argc, char** argv) {
    TestLogOptions options;
    const std::string maskFlag = "--fpe_log_mask";
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (boost::starts_with(arg, maskFlag)) {
            options.enabled = true;
            if (arg.size() > maskFlag.size() && arg[maskFlag.size()] == '=')
                options.mask = boost::lexical_cast<unsigned int>(arg.substr(maskFlag.size() + 1));
        } else if (arg == "--fpe_log_structured") {
            options.enabled = true;
            options.structuredOnly = true;
        }
    }
    return options;
}

//! Writes engine log messages to the Boost.Test log
/*! Structured warnings and errors, i.e. degraded fixings and rejected period configurations, are reported with
    their category in front of the JSON body and counted. Other messages are written unchanged unless the logger
    keeps structured messages only. Run the tests with "--log_level=message" to see the output.
    \ingroup utilities
    \see Log
 */
class BoostTestLogger : public fpe::engine::Logger {
public:
    explicit BoostTestLogger(bool structuredOnly = false)
        : fpe::engine::Logger("BoostTestLogger"), structuredOnly_(structuredOnly), warnings_(0), errors_(0) {}

    void log(unsigned, const std::string& msg) override {
        if (report(msg, "StructuredWarningMessage ", "warning", warnings_) ||
            report(msg, "StructuredErrorMessage ", "error", errors_))
            return;
        if (!structuredOnly_)
            BOOST_TEST_MESSAGE(msg);
    }

    //! Number of structured warnings seen
    QuantLib::Size warnings() const { return warnings_; }
    //! Number of structured errors seen
    QuantLib::Size errors() const { return errors_; }

private:
    bool report(const std::string& msg, const std::string& tag, const char* category, QuantLib::Size& count) {
        std::string::size_type pos = msg.find(tag);
        if (pos == std::string::npos)
            return false;
        ++count;
        BOOST_TEST_MESSAGE("structured " << category << " " << msg.substr(pos + tag.size()));
        return true;
    }

    bool structuredOnly_;
    QuantLib::Size warnings_, errors_;
};

//! Sets up the engine log for the test run if the command line asks for it
/*! \return the registered logger, null if logging stays off */
inline QuantLib::ext::shared_ptr<BoostTestLogger> setupTestLogging(int argc, char** argv) {
    TestLogOptions options = parseTestLogOptions(argc, argv);
    if (!options.enabled)
        return nullptr;

    auto logger = QuantLib::ext::make_shared<BoostTestLogger>(options.structuredOnly);
    fpe::engine::Log& log = fpe::engine::Log::instance();
    log.removeAllLoggers();
    log.registerLogger(logger);
    log.switchOn();
    log.setMask(options.structuredOnly ? (FPE_ALERT | FPE_WARNING) : options.mask);
    return logger;
}

} // namespace test
} // namespace fpe
