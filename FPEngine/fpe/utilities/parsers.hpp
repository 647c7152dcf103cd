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

/*! \file fpe/utilities/parsers.hpp
    \brief Map text representations to QuantLib and period structures
    \ingroup utilities
*/

#pragma once

#include <fpe/periods/types.hpp>

#include <ql/time/daycounter.hpp>
#include <ql/time/frequency.hpp>

#include <string>

namespace fpe {
namespace engine {

//! Convert text to QuantLib::DayCounter
/*! The lookup is case insensitive, e.g. "Act360", "A360", "ACT/360" all give Actual360().
    \ingroup utilities
*/
QuantLib::DayCounter parseDayCounter(const std::string& s);

//! Convert text to QuantLib::Frequency
/*! Accepts the single letter tags "M", "B", "Q", "T", "S", "A", "Z" and the QuantLib names.
    \ingroup utilities
*/
QuantLib::Frequency parseFrequency(const std::string& s);

//! Convert text to FixingMethod
/*!
    \ingroup utilities
*/
FixingMethod parseFixingMethod(const std::string& s);

//! Convert text to SpreadCompoundMethod
/*!
    \ingroup utilities
*/
SpreadCompoundMethod parseSpreadCompoundMethod(const std::string& s);

//! Short convention tag of a day counter as used in cashflow reports, e.g. "Act360"
std::string dayCounterTag(const QuantLib::DayCounter& dc);

} // namespace engine
} // namespace fpe
