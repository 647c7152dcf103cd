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

/*! \file fpe/periods/types.hpp
    \brief Enumerations configuring a floating rate period
    \ingroup periods
*/

#pragma once

#include <iosfwd>

namespace fpe {
namespace engine {

//! How the observations of a reference rate are aligned to the accrual period
enum class FixingMethod {
    RfrPaymentDelay,
    RfrLockout,
    RfrLookback,
    RfrObservationShift,
    Ibor
};

//! How a float spread is combined with the compounded base rate
enum class SpreadCompoundMethod {
    NoneSimple,
    IsdaCompounding,
    IsdaFlatCompounding
};

std::ostream& operator<<(std::ostream& out, const FixingMethod& m);

std::ostream& operator<<(std::ostream& out, const SpreadCompoundMethod& m);

//! True for the overnight (RFR) methods
bool isRfrMethod(FixingMethod m);

} // namespace engine
} // namespace fpe
