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

#include <fpe/curves/ratecurve.hpp>
#include <fpe/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/io.hpp>
#include <ql/math/interpolations/linearinterpolation.hpp>
#include <ql/utilities/null.hpp>

using namespace QuantLib;

namespace fpe {
namespace engine {

RateCurve::RateCurve(const std::vector<Date>& dates, const std::vector<Real>& rates, const DayCounter& dayCounter,
                     const Calendar& calendar, const Interpolator& interpolator)
    : ProjectionCurve(calendar, dayCounter), dates_(dates), rates_(rates), customInterpolator_(interpolator) {
    QL_REQUIRE(!dates_.empty(), "RateCurve: at least one node required");
    QL_REQUIRE(dates_.size() == rates_.size(), "RateCurve: dates (" << dates_.size() << ") and rates ("
                                                                    << rates_.size() << ") must have the same size");
    for (Size i = 1; i < dates_.size(); ++i) {
        QL_REQUIRE(dates_[i] > dates_[i - 1], "RateCurve: node dates must be strictly increasing, "
                                                  << io::iso_date(dates_[i]) << " follows "
                                                  << io::iso_date(dates_[i - 1]));
    }

    if (!customInterpolator_ && dates_.size() > 1) {
        for (const auto& d : dates_)
            serials_.push_back(static_cast<Real>(d.serialNumber()));
        interpolation_ = LinearInterpolation(serials_.begin(), serials_.end(), rates_.begin());
        interpolation_.enableExtrapolation();
    }
    DLOG("RateCurve built on " << dates_.size() << " nodes, "
                               << (customInterpolator_ ? "custom" : "linear") << " interpolation");
}

Real RateCurve::valueAt(const Date& d) const {
    if (customInterpolator_)
        return customInterpolator_(d, dates_, rates_);
    if (dates_.size() == 1)
        return rates_.front();
    return interpolation_(static_cast<Real>(d.serialNumber()));
}

Real RateCurve::forwardRate(const Date& d1, const Date&, const DayCounter&) const { return valueAt(d1); }

} // namespace engine
} // namespace fpe
