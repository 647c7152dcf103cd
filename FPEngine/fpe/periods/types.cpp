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

#include <fpe/periods/types.hpp>

#include <ql/errors.hpp>

#include <ostream>

namespace fpe {
namespace engine {

std::ostream& operator<<(std::ostream& out, const FixingMethod& m) {
    switch (m) {
    case FixingMethod::RfrPaymentDelay:
        return out << "rfr_payment_delay";
    case FixingMethod::RfrLockout:
        return out << "rfr_lockout";
    case FixingMethod::RfrLookback:
        return out << "rfr_lookback";
    case FixingMethod::RfrObservationShift:
        return out << "rfr_observation_shift";
    case FixingMethod::Ibor:
        return out << "ibor";
    default:
        return out << "Unknown FixingMethod (" << static_cast<int>(m) << ")";
    }
}

std::ostream& operator<<(std::ostream& out, const SpreadCompoundMethod& m) {
    switch (m) {
    case SpreadCompoundMethod::NoneSimple:
        return out << "none_simple";
    case SpreadCompoundMethod::IsdaCompounding:
        return out << "isda_compounding";
    case SpreadCompoundMethod::IsdaFlatCompounding:
        return out << "isda_flat_compounding";
    default:
        return out << "Unknown SpreadCompoundMethod (" << static_cast<int>(m) << ")";
    }
}

bool isRfrMethod(FixingMethod m) {
    switch (m) {
    case FixingMethod::RfrPaymentDelay:
    case FixingMethod::RfrLockout:
    case FixingMethod::RfrLookback:
    case FixingMethod::RfrObservationShift:
        return true;
    case FixingMethod::Ibor:
        return false;
    default:
        QL_FAIL("`fixing_method` must be in {rfr_payment_delay, rfr_lockout, rfr_lookback, rfr_observation_shift, "
                "ibor}, got "
                << m);
    }
}

} // namespace engine
} // namespace fpe
