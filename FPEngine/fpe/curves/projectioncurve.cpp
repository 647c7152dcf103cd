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

#include <fpe/curves/projectioncurve.hpp>
#include <fpe/utilities/log.hpp>

#include <ql/errors.hpp>

namespace fpe {
namespace engine {

ProjectionCurve::ProjectionCurve(const QuantLib::Calendar& calendar, const QuantLib::DayCounter& dayCounter)
    : calendar_(calendar), dayCounter_(dayCounter), derivativeOrder_(0) {
    QL_REQUIRE(!calendar_.empty(), "ProjectionCurve: calendar must not be empty");
    QL_REQUIRE(!dayCounter_.empty(), "ProjectionCurve: day counter must not be empty");
}

void ProjectionCurve::setDerivativeOrder(QuantLib::Size order) {
    QL_REQUIRE(order <= 2, "ProjectionCurve: derivative order must be 0, 1 or 2, got " << order);
    derivativeOrder_ = order;
}

DerivativeOrderGuard::DerivativeOrderGuard(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                                           QuantLib::Size order)
    : curve_(curve), previous_(0) {
    if (curve_) {
        previous_ = curve_->derivativeOrder();
        if (previous_ != order) {
            DLOG("DerivativeOrderGuard: switching curve derivative order " << previous_ << " -> " << order);
            curve_->setDerivativeOrder(order);
        }
    }
}

DerivativeOrderGuard::~DerivativeOrderGuard() {
    if (curve_ && curve_->derivativeOrder() != previous_)
        curve_->setDerivativeOrder(previous_);
}

} // namespace engine
} // namespace fpe
