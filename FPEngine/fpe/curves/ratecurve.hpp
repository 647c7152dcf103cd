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

/*! \file fpe/curves/ratecurve.hpp
    \brief Curve of directly quoted reference rates
    \ingroup curves
*/

#pragma once

#include <fpe/curves/projectioncurve.hpp>

#include <ql/math/interpolation.hpp>
#include <ql/time/calendars/nullcalendar.hpp>
#include <ql/time/daycounters/actual360.hpp>

#include <functional>
#include <vector>

namespace fpe {
namespace engine {

//! Curve of rates in percent, sampled directly at the fixing date
/*! By default the rates are interpolated linearly in calendar days and extrapolated linearly outside the nodes. A
    custom interpolator can be supplied; it may return Null<Real>() for dates it cannot value.

    \ingroup curves
*/
class RateCurve : public ProjectionCurve {
public:
    typedef std::function<QuantLib::Real(const QuantLib::Date&, const std::vector<QuantLib::Date>&,
                                         const std::vector<QuantLib::Real>&)>
        Interpolator;

    RateCurve(const std::vector<QuantLib::Date>& dates, const std::vector<QuantLib::Real>& rates,
              const QuantLib::DayCounter& dayCounter = QuantLib::Actual360(),
              const QuantLib::Calendar& calendar = QuantLib::NullCalendar(),
              const Interpolator& interpolator = Interpolator());

    // the interpolation refers to the node vectors of this instance
    RateCurve(const RateCurve&) = delete;
    RateCurve& operator=(const RateCurve&) = delete;

    //! Rate in percent at \p d, Null<Real>() if the interpolator cannot value the date
    QuantLib::Real valueAt(const QuantLib::Date& d) const;

    //! The rate fixed on \p d1, the window and the convention do not enter
    QuantLib::Real forwardRate(const QuantLib::Date& d1, const QuantLib::Date& d2,
                               const QuantLib::DayCounter& dc) const override;

    const std::vector<QuantLib::Date>& dates() const { return dates_; }
    const std::vector<QuantLib::Real>& rates() const { return rates_; }

private:
    std::vector<QuantLib::Date> dates_;
    std::vector<QuantLib::Real> rates_;
    std::vector<QuantLib::Real> serials_;
    Interpolator customInterpolator_;
    QuantLib::Interpolation interpolation_;
};

} // namespace engine
} // namespace fpe
