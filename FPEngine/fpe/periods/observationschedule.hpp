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

/*! \file fpe/periods/observationschedule.hpp
    \brief Observation dates and compounding weights of an overnight rate period
    \ingroup periods
*/

#pragma once

#include <fpe/periods/types.hpp>

#include <ql/time/calendar.hpp>
#include <ql/time/date.hpp>
#include <ql/time/daycounter.hpp>

#include <vector>

namespace fpe {
namespace engine {

//! Observation windows of an overnight rate period
/*! For n compounding steps the schedule holds n + 1 observation dates and n + 1 accrual dates. Window i on the
    observation side, [observationDates[i], observationDates[i+1]], is the window the rate i is fixed for; its
    length is observationDcfs[i]. Step i of the compounding uses the rate of window rateIndex[i] and is weighted
    by accrualDcfs[i].

    - rfr_payment_delay: observation and accrual dates are the business days of the period.
    - rfr_observation_shift: both sides are the business days of the period shifted back by the method parameter.
    - rfr_lookback: accrual dates are the business days of the period, each observation date is its accrual date
      shifted back by the method parameter.
    - rfr_lockout: as rfr_payment_delay, but the last method parameter steps use the rate of the last step that is
      not locked.

    \ingroup periods
*/
struct ObservationSchedule {
    std::vector<QuantLib::Date> observationDates;
    std::vector<QuantLib::Real> observationDcfs;
    std::vector<QuantLib::Date> accrualDates;
    std::vector<QuantLib::Real> accrualDcfs;
    std::vector<QuantLib::Size> rateIndex;

    //! Number of compounding steps
    QuantLib::Size size() const { return accrualDcfs.size(); }
    //! Sum of the compounding weights
    QuantLib::Real totalDcf() const;
};

//! The business days in [start, end) followed by \p end
std::vector<QuantLib::Date> businessDayRange(const QuantLib::Date& start, const QuantLib::Date& end,
                                             const QuantLib::Calendar& calendar);

//! Build the observation schedule of the period [start, end]
/*! \param dayCounter measures the observation and accrual windows
    Throws for an unknown fixing method, for rfr_lockout with no more steps than the method parameter and for the
    ibor method, which does not observe an overnight schedule.
*/
ObservationSchedule buildObservationSchedule(FixingMethod method, QuantLib::Integer methodParam,
                                             const QuantLib::Date& start, const QuantLib::Date& end,
                                             const QuantLib::Calendar& calendar,
                                             const QuantLib::DayCounter& dayCounter);

} // namespace engine
} // namespace fpe
