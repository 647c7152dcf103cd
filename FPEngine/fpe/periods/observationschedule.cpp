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

#include <fpe/periods/observationschedule.hpp>
#include <fpe/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/io.hpp>

#include <algorithm>
#include <numeric>

using namespace QuantLib;
using std::vector;

namespace fpe {
namespace engine {

Real ObservationSchedule::totalDcf() const { return std::accumulate(accrualDcfs.begin(), accrualDcfs.end(), 0.0); }

vector<Date> businessDayRange(const Date& start, const Date& end, const Calendar& calendar) {
    QL_REQUIRE(start < end, "businessDayRange: start (" << io::iso_date(start) << ") must be before end ("
                                                        << io::iso_date(end) << ")");
    vector<Date> dates;
    for (Date d = start; d < end; d = calendar.advance(d, 1, Days))
        dates.push_back(d);
    dates.push_back(end);
    return dates;
}

namespace {

vector<Real> windowDcfs(const vector<Date>& dates, const DayCounter& dc) {
    vector<Real> dcfs;
    for (Size i = 0; i + 1 < dates.size(); ++i)
        dcfs.push_back(dc.yearFraction(dates[i], dates[i + 1]));
    return dcfs;
}

Date shift(const Date& d, Integer businessDays, const Calendar& calendar) {
    return businessDays == 0 ? d : calendar.advance(d, -businessDays, Days);
}

} // namespace

ObservationSchedule buildObservationSchedule(FixingMethod method, Integer methodParam, const Date& start,
                                             const Date& end, const Calendar& calendar,
                                             const DayCounter& dayCounter) {
    ObservationSchedule s;

    switch (method) {
    case FixingMethod::RfrPaymentDelay:
    case FixingMethod::RfrLockout:
        s.accrualDates = businessDayRange(start, end, calendar);
        s.observationDates = s.accrualDates;
        break;
    case FixingMethod::RfrObservationShift:
        s.accrualDates =
            businessDayRange(shift(start, methodParam, calendar), shift(end, methodParam, calendar), calendar);
        s.observationDates = s.accrualDates;
        break;
    case FixingMethod::RfrLookback:
        s.accrualDates = businessDayRange(start, end, calendar);
        for (const auto& d : s.accrualDates)
            s.observationDates.push_back(shift(d, methodParam, calendar));
        break;
    case FixingMethod::Ibor:
        QL_FAIL("buildObservationSchedule: the ibor `fixing_method` observes a single fixing date");
    default:
        QL_FAIL("`fixing_method` must be in {rfr_payment_delay, rfr_lockout, rfr_lookback, rfr_observation_shift}, "
                "got "
                << method);
    }

    s.accrualDcfs = windowDcfs(s.accrualDates, dayCounter);
    s.observationDcfs = windowDcfs(s.observationDates, dayCounter);

    Size n = s.accrualDcfs.size();
    s.rateIndex.resize(n);
    std::iota(s.rateIndex.begin(), s.rateIndex.end(), 0);

    if (method == FixingMethod::RfrLockout) {
        QL_REQUIRE(methodParam > 0, "`method_param` must be >0 for \"rfr_lockout\" `fixing_method`");
        Size locked = static_cast<Size>(methodParam);
        QL_REQUIRE(n > locked, "period has too few dates for `rfr_lockout` method to lock sufficient fixings: "
                                   << n << " observation date(s), method_param " << locked);
        for (Size i = n - locked; i < n; ++i)
            s.rateIndex[i] = n - locked - 1;
    }

    TLOG("ObservationSchedule " << method << " [" << io::iso_date(start) << ", " << io::iso_date(end) << "]: " << n
                                << " steps, observations from " << io::iso_date(s.observationDates.front()));
    return s;
}

} // namespace engine
} // namespace fpe
