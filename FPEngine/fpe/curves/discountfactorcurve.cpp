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

#include <fpe/curves/discountfactorcurve.hpp>
#include <fpe/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/io.hpp>
#include <ql/math/interpolations/loginterpolation.hpp>
#include <ql/termstructures/yield/discountcurve.hpp>
#include <ql/time/daycounters/actual365fixed.hpp>
#include <ql/utilities/null.hpp>

using namespace QuantLib;

namespace fpe {
namespace engine {

DiscountFactorCurve::DiscountFactorCurve(const std::vector<Date>& dates, const std::vector<Real>& discounts,
                                         const DayCounter& dayCounter, const Calendar& calendar)
    : ProjectionCurve(calendar, dayCounter), dates_(dates), discounts_(discounts) {
    QL_REQUIRE(dates_.size() >= 2, "DiscountFactorCurve: at least two nodes required, got " << dates_.size());
    QL_REQUIRE(dates_.size() == discounts_.size(), "DiscountFactorCurve: dates (" << dates_.size()
                                                       << ") and discounts (" << discounts_.size()
                                                       << ") must have the same size");
    QL_REQUIRE(discounts_.front() == 1.0,
               "DiscountFactorCurve: the first discount factor must be 1.0, got " << discounts_.front());
    for (Size i = 1; i < dates_.size(); ++i) {
        QL_REQUIRE(dates_[i] > dates_[i - 1], "DiscountFactorCurve: node dates must be strictly increasing, "
                                                  << io::iso_date(dates_[i]) << " follows "
                                                  << io::iso_date(dates_[i - 1]));
        QL_REQUIRE(discounts_[i] > 0.0, "DiscountFactorCurve: discount factor at " << io::iso_date(dates_[i])
                                                                                     << " must be positive");
    }

    // the time axis is linear in calendar days so that log-linear interpolation in time is log-linear in days
    curve_ = QuantLib::ext::make_shared<InterpolatedDiscountCurve<LogLinear>>(dates_, discounts_, Actual365Fixed(),
                                                                            NullCalendar());
    curve_->enableExtrapolation();
    DLOG("DiscountFactorCurve built on " << dates_.size() << " nodes from " << io::iso_date(dates_.front()) << " to "
                                         << io::iso_date(dates_.back()));
}

Real DiscountFactorCurve::discountFactor(const Date& d) const {
    if (d < dates_.front())
        return Null<Real>();
    return curve_->discount(d);
}

Real DiscountFactorCurve::forwardRate(const Date& d1, const Date& d2, const DayCounter& dc) const {
    QL_REQUIRE(d2 > d1, "DiscountFactorCurve: forward rate requires d1 (" << io::iso_date(d1) << ") < d2 ("
                                                                           << io::iso_date(d2) << ")");
    Real df1 = discountFactor(d1);
    Real df2 = discountFactor(d2);
    if (df1 == Null<Real>() || df2 == Null<Real>())
        return Null<Real>();
    return (df1 / df2 - 1.0) / dc.yearFraction(d1, d2) * 100.0;
}

} // namespace engine
} // namespace fpe
