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

/*! \file fpe/curves/discountfactorcurve.hpp
    \brief Discount factor curve with log-linear interpolation
    \ingroup curves
*/

#pragma once

#include <fpe/curves/projectioncurve.hpp>

#include <ql/time/calendars/nullcalendar.hpp>
#include <ql/time/daycounters/actual360.hpp>

#include <vector>

namespace QuantLib {
class YieldTermStructure;
}

namespace fpe {
namespace engine {

//! Curve of discount factors
/*! The first node is the reference date of the curve and must carry a discount factor of 1.0. Discount factors are
    interpolated log-linearly in calendar days and extrapolated beyond the last node from the last segment. Dates
    before the first node have no discount factor.

    \ingroup curves
*/
class DiscountFactorCurve : public ProjectionCurve {
public:
    DiscountFactorCurve(const std::vector<QuantLib::Date>& dates, const std::vector<QuantLib::Real>& discounts,
                        const QuantLib::DayCounter& dayCounter = QuantLib::Actual360(),
                        const QuantLib::Calendar& calendar = QuantLib::NullCalendar());

    //! Discount factor at \p d, Null<Real>() before the first node
    QuantLib::Real discountFactor(const QuantLib::Date& d) const;

    //! (df(d1) / df(d2) - 1) / dcf(d1, d2) in percent
    QuantLib::Real forwardRate(const QuantLib::Date& d1, const QuantLib::Date& d2,
                               const QuantLib::DayCounter& dc) const override;

    const std::vector<QuantLib::Date>& dates() const { return dates_; }
    const std::vector<QuantLib::Real>& discounts() const { return discounts_; }

private:
    std::vector<QuantLib::Date> dates_;
    std::vector<QuantLib::Real> discounts_;
    QuantLib::ext::shared_ptr<QuantLib::YieldTermStructure> curve_;
};

} // namespace engine
} // namespace fpe
