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

/*! \file fpe/periods/exposuretable.hpp
    \brief Per observation date breakdown of the rate risk of a floating period
    \ingroup periods
*/

#pragma once

#include <fpe/periods/fixings.hpp>
#include <fpe/periods/observationschedule.hpp>
#include <fpe/periods/ratecompounder.hpp>
#include <fpe/periods/termrateresolver.hpp>

#include <boost/optional.hpp>

#include <vector>

namespace fpe {
namespace engine {

//! One row of an exposure table
struct ExposureRow {
    QuantLib::Date date;
    //! Notional of a one day deposit with the same sensitivity to the rate of this date
    QuantLib::Real notional;
    //! The day count fraction of the observation window, none for single fixings and the aggregate row
    boost::optional<QuantLib::Real> dcf;
    //! The resolved rate in percent
    QuantLib::Real rate;
};

typedef std::vector<ExposureRow> ExposureTable;

//! Builds the exposure table of a floating period
/*! For an overnight period the row of observation date k carries the notional -N * dcf / dcf_k * dR/dr_k where R is
    the period rate, r_k the rate of observation k, dcf the period's day count fraction and dcf_k the one of the
    observation window. The derivative is the closed form of the compounded product for simple periods and
    propagated through the full compounding chain for complex ones, where the spread and locked or shifted rates
    couple the dates. Locked observation dates have zero exposure and show the rate they are locked to.

    A term rate period has a single row on its fixing date with notional -N and no day count fraction.

    The curve is queried at derivative order 0 while the table is built.

    \ingroup periods
*/
class ExposureTableBuilder {
public:
    /*! \param fixingExposure if true, a final row with the period cashflow as notional and the period rate is
               appended
    */
    ExposureTableBuilder(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve, QuantLib::Real notional,
                         QuantLib::Real periodDcf, QuantLib::Real floatSpread, bool fixingExposure = false);

    //! Table of an overnight rate period
    ExposureTable build(const ObservationSchedule& schedule, const FixingResolver& resolver,
                        const RateCompounder& compounder, bool complex) const;

    //! Table of a term rate period
    ExposureTable build(const TermRateResolver& resolver, const QuantLib::Date& start, const QuantLib::Date& end,
                        QuantLib::Frequency frequency, bool stub, const QuantLib::DayCounter& dayCounter,
                        const QuantLib::Calendar& calendar) const;

private:
    void appendAggregate(ExposureTable& table, const QuantLib::Date& d, QuantLib::Real rate) const;

    QuantLib::ext::shared_ptr<ProjectionCurve> curve_;
    QuantLib::Real notional_, periodDcf_, floatSpread_;
    bool fixingExposure_;
};

} // namespace engine
} // namespace fpe
