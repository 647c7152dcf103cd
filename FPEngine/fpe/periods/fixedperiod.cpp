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

#include <fpe/periods/fixedperiod.hpp>

using namespace QuantLib;

namespace fpe {
namespace engine {

FixedPeriod::FixedPeriod(const Date& start, const Date& end, const Date& payment, Frequency frequency,
                         const boost::optional<Real>& fixedRate, Real notional, const std::string& currency,
                         const DayCounter& dayCounter, const Date& termination, bool stub)
    : AccrualPeriod(start, end, payment, frequency, notional, currency, dayCounter, termination, stub),
      fixedRate_(fixedRate) {}

boost::optional<Real> FixedPeriod::cashflow(const QuantLib::ext::shared_ptr<ProjectionCurve>&) const {
    if (!fixedRate_)
        return boost::none;
    return -notional_ * dcf_ * *fixedRate_ / 100.0;
}

Real FixedPeriod::localAnalyticDelta(const QuantLib::ext::shared_ptr<ProjectionCurve>&, Real discountFactor) const {
    return basisPointValue(discountFactor);
}

void FixedPeriod::addReportData(PeriodCashflowReportData& data,
                                const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const {
    AccrualPeriod::addReportData(data, curve);
    data.rate = fixedRate_;
}

Cashflow::Cashflow(Real notional, const Date& payment, const std::string& currency)
    : BasePeriod(payment, notional, currency) {}

boost::optional<Real> Cashflow::cashflow(const QuantLib::ext::shared_ptr<ProjectionCurve>&) const {
    return -notional_;
}

} // namespace engine
} // namespace fpe
