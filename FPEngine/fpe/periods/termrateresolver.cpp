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
#include <fpe/curves/ratecurve.hpp>
#include <fpe/periods/termrateresolver.hpp>
#include <fpe/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/io.hpp>
#include <ql/time/period.hpp>
#include <ql/utilities/null.hpp>

using namespace QuantLib;

namespace fpe {
namespace engine {

TermRateResolver::TermRateResolver(const Fixings& fixings, Integer fixingDays)
    : fixings_(fixings), fixingDays_(fixingDays) {
    QL_REQUIRE(boost::get<std::vector<Real>>(&fixings_) == nullptr,
               "`fixings` can only be a single value for this method, or a series of historical fixings");
}

Date TermRateResolver::fixingDate(const Date& start, const Calendar& calendar) const {
    return calendar.advance(start, -fixingDays_, Days);
}

Date TermRateResolver::tenorEnd(const Date& start, const Date& end, Frequency frequency, bool stub,
                                const Calendar& calendar) const {
    if (stub || frequency == Once || frequency == NoFrequency)
        return end;
    return calendar.advance(start, QuantLib::Period(frequency), ModifiedFollowing);
}

ResolvedFixing TermRateResolver::resolve(const Date& start, const Date& end, Frequency frequency, bool stub,
                                         const DayCounter& dayCounter, const Calendar& calendar,
                                         const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const {
    Date fd = fixingDate(start, calendar);

    if (const Real* r = boost::get<Real>(&fixings_))
        return {fd, *r, FixingSource::Override};
    if (const FixingSeries* s = boost::get<FixingSeries>(&fixings_)) {
        checkFixingSeries(*s);
        Real r = s->find(fd);
        if (r != Null<Real>())
            return {fd, r, FixingSource::Override};
        DLOG("TermRateResolver: no historical fixing on " << io::iso_date(fd) << ", projecting from the curve");
    }

    QL_REQUIRE(curve, "rates could not be calculated: no fixing and no curve for fixing date " << io::iso_date(fd));

    Real rate = Null<Real>();
    if (auto rc = QuantLib::ext::dynamic_pointer_cast<RateCurve>(curve)) {
        rate = rc->valueAt(fd);
    } else if (auto dfc = QuantLib::ext::dynamic_pointer_cast<DiscountFactorCurve>(curve)) {
        rate = dfc->forwardRate(start, tenorEnd(start, end, frequency, stub, calendar), dayCounter);
    } else {
        QL_FAIL("`curve` must be of type DiscountFactorCurve or RateCurve");
    }
    QL_REQUIRE(rate != Null<Real>(),
               "rates could not be calculated: the curve has no value for fixing date " << io::iso_date(fd));
    return {fd, rate, FixingSource::Curve};
}

} // namespace engine
} // namespace fpe
