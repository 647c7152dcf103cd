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

#include <fpe/curves/curvecheck.hpp>

#include <ql/errors.hpp>

namespace fpe {
namespace engine {

void checkProjectionCurve(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) {
    if (!curve)
        return;
    QL_REQUIRE(QuantLib::ext::dynamic_pointer_cast<DiscountFactorCurve>(curve) ||
                   QuantLib::ext::dynamic_pointer_cast<RateCurve>(curve),
               "`curve` must be of type DiscountFactorCurve or RateCurve");
}

QuantLib::ext::shared_ptr<DiscountFactorCurve>
discountFactorCurve(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) {
    QL_REQUIRE(curve, "a discount curve is required");
    auto dfc = QuantLib::ext::dynamic_pointer_cast<DiscountFactorCurve>(curve);
    QL_REQUIRE(dfc, "`disc_curve` must be of type DiscountFactorCurve");
    return dfc;
}

} // namespace engine
} // namespace fpe
