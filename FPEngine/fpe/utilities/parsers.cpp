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

#include <fpe/periods/structuredperiodmessage.hpp>
#include <fpe/utilities/parsers.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <ql/errors.hpp>
#include <ql/time/daycounters/actual360.hpp>
#include <ql/time/daycounters/actual365fixed.hpp>
#include <ql/time/daycounters/actualactual.hpp>
#include <ql/time/daycounters/one.hpp>
#include <ql/time/daycounters/thirty360.hpp>

#include <map>
#include <sstream>

using namespace QuantLib;
using std::map;
using std::string;

namespace fpe {
namespace engine {

namespace {
string normalise(const string& s) { return boost::to_lower_copy(boost::trim_copy(s)); }
} // namespace

DayCounter parseDayCounter(const string& s) {
    static map<string, DayCounter> m = {{"act360", Actual360()},
                                        {"a360", Actual360()},
                                        {"act/360", Actual360()},
                                        {"actual/360", Actual360()},
                                        {"act365f", Actual365Fixed()},
                                        {"a365f", Actual365Fixed()},
                                        {"a365", Actual365Fixed()},
                                        {"act/365", Actual365Fixed()},
                                        {"act/365f", Actual365Fixed()},
                                        {"actual/365 (fixed)", Actual365Fixed()},
                                        {"actacticma", ActualActual(ActualActual::ISMA)},
                                        {"actactisda", ActualActual(ActualActual::ISDA)},
                                        {"act/act", ActualActual(ActualActual::ISDA)},
                                        {"30360", Thirty360(Thirty360::BondBasis)},
                                        {"30/360", Thirty360(Thirty360::BondBasis)},
                                        {"30e360", Thirty360(Thirty360::European)},
                                        {"30e/360", Thirty360(Thirty360::European)},
                                        {"1/1", OneDayCounter()},
                                        {"1", OneDayCounter()}};

    auto it = m.find(normalise(s));
    if (it != m.end()) {
        return it->second;
    } else {
        QL_FAIL("DayCounter \"" << s << "\" not recognized");
    }
}

Frequency parseFrequency(const string& s) {
    static map<string, Frequency> m = {{"z", Once},       {"once", Once},
                                       {"a", Annual},     {"annual", Annual},
                                       {"s", Semiannual}, {"semiannual", Semiannual},
                                       {"t", EveryFourthMonth}, {"everyfourthmonth", EveryFourthMonth},
                                       {"q", Quarterly},  {"quarterly", Quarterly},
                                       {"b", Bimonthly},  {"bimonthly", Bimonthly},
                                       {"m", Monthly},    {"monthly", Monthly}};

    auto it = m.find(normalise(s));
    if (it != m.end()) {
        return it->second;
    } else {
        QL_FAIL("Frequency \"" << s << "\" not recognized");
    }
}

FixingMethod parseFixingMethod(const string& s) {
    static map<string, FixingMethod> m = {{"rfr_payment_delay", FixingMethod::RfrPaymentDelay},
                                          {"rfr_lockout", FixingMethod::RfrLockout},
                                          {"rfr_lookback", FixingMethod::RfrLookback},
                                          {"rfr_observation_shift", FixingMethod::RfrObservationShift},
                                          {"ibor", FixingMethod::Ibor}};

    auto it = m.find(normalise(s));
    if (it != m.end()) {
        return it->second;
    } else {
        std::ostringstream what;
        what << "`fixing_method` must be in {rfr_payment_delay, rfr_lockout, rfr_lookback, rfr_observation_shift, "
                "ibor}, got \""
             << s << "\"";
        StructuredConfigurationErrorMessage("fixing_method", "Invalid enumeration value", what.str()).log();
        QL_FAIL(what.str());
    }
}

SpreadCompoundMethod parseSpreadCompoundMethod(const string& s) {
    static map<string, SpreadCompoundMethod> m = {
        {"none_simple", SpreadCompoundMethod::NoneSimple},
        {"isda_compounding", SpreadCompoundMethod::IsdaCompounding},
        {"isda_flat_compounding", SpreadCompoundMethod::IsdaFlatCompounding}};

    auto it = m.find(normalise(s));
    if (it != m.end()) {
        return it->second;
    } else {
        std::ostringstream what;
        what << "`spread_compound_method` must be in {none_simple, isda_compounding, isda_flat_compounding}, got \""
             << s << "\"";
        StructuredConfigurationErrorMessage("spread_compound_method", "Invalid enumeration value", what.str()).log();
        QL_FAIL(what.str());
    }
}

string dayCounterTag(const DayCounter& dc) {
    if (dc == Actual360())
        return "Act360";
    if (dc == Actual365Fixed())
        return "Act365F";
    if (dc == ActualActual(ActualActual::ISDA))
        return "ActActISDA";
    if (dc == ActualActual(ActualActual::ISMA))
        return "ActActICMA";
    if (dc == Thirty360(Thirty360::BondBasis))
        return "30360";
    if (dc == Thirty360(Thirty360::European))
        return "30e360";
    if (dc == OneDayCounter())
        return "1";
    return dc.name();
}

} // namespace engine
} // namespace fpe
