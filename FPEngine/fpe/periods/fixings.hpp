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

/*! \file fpe/periods/fixings.hpp
    \brief Historical fixing overrides and their resolution against a projection curve
    \ingroup periods
*/

#pragma once

#include <fpe/curves/projectioncurve.hpp>
#include <fpe/periods/observationschedule.hpp>
#include <fpe/periods/types.hpp>

#include <boost/variant.hpp>

#include <string>
#include <utility>
#include <vector>

namespace fpe {
namespace engine {

//! Date indexed series of historical fixings in percent
/*! The series keeps the order in which the fixings were supplied, so that a series whose dates are not increasing
    can be detected and rejected when it is used.
    \ingroup periods
*/
class FixingSeries {
public:
    FixingSeries() {}
    FixingSeries(const std::vector<QuantLib::Date>& dates, const std::vector<QuantLib::Real>& values);

    void add(const QuantLib::Date& d, QuantLib::Real value) { data_.emplace_back(d, value); }

    bool empty() const { return data_.empty(); }
    QuantLib::Size size() const { return data_.size(); }
    //! True if the dates are strictly increasing
    bool isIncreasing() const;
    //! The last date in the series (the most recent if the series is increasing)
    const QuantLib::Date& lastDate() const;
    //! The fixing for \p d, Null<Real>() if there is none
    QuantLib::Real find(const QuantLib::Date& d) const;

    const std::vector<std::pair<QuantLib::Date, QuantLib::Real>>& data() const { return data_; }

private:
    std::vector<std::pair<QuantLib::Date, QuantLib::Real>> data_;
};

//! The fixings supplied for a period: none, a single value, values for the first observation dates or a series
typedef boost::variant<boost::blank, QuantLib::Real, std::vector<QuantLib::Real>, FixingSeries> Fixings;

//! Where a resolved rate came from
/*! Unobserved windows, e.g. the locked windows of rfr_lockout, are not used by any compounding step and carry no
    rate.
*/
enum class FixingSource { Override, Curve, Missing, Unobserved };

std::ostream& operator<<(std::ostream& out, const FixingSource& s);

//! A rate in percent for one observation date together with its provenance
struct ResolvedFixing {
    QuantLib::Date date;
    QuantLib::Real rate;
    FixingSource source;
};

//! Validates that a series of fixings has increasing dates, throws otherwise
void checkFixingSeries(const FixingSeries& series);

//! Merges fixing overrides with rates projected from a curve, one rate per observation window
/*! Overrides are applied per observation date:
    - a single value is the realized compounded rate of the whole period and is reported for every date,
    - a vector overrides the first observation dates, oldest first,
    - a series overrides the observation dates it contains.

    Dates without an override are projected from the curve over their observation window, unless no compounding
    step uses the window. A date for which neither
    an override nor a projected value is available is returned with source FixingSource::Missing; resolveAll()
    turns that into an error.

    Degraded but usable input is reported through structured warnings: dates missing from a series although they
    are not later than its last date, and overrides combined with a non-zero spread compounded into the base rate.

    \ingroup periods
*/
class FixingResolver {
public:
    FixingResolver(const Fixings& fixings, QuantLib::Real floatSpread = 0.0,
                   SpreadCompoundMethod spreadCompoundMethod = SpreadCompoundMethod::NoneSimple);

    //! Resolve every observation window of \p schedule, unresolved windows have source Missing
    std::vector<ResolvedFixing> resolve(const ObservationSchedule& schedule,
                                        const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const;

    //! As resolve() but throws if a window could not be resolved
    std::vector<ResolvedFixing> resolveAll(const ObservationSchedule& schedule,
                                           const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const;

    //! True if the overrides alone give a rate for every window of \p schedule a compounding step uses
    /*! No curve is queried and nothing is logged. The fixings may still be rejected by resolve(). */
    bool determinesRates(const ObservationSchedule& schedule) const;

    //! True if the fixings are a single value, which fixes the rate of the whole period
    bool fixesPeriod() const;
    //! The single value fixing the period, Null<Real>() if the fixings are of another kind
    QuantLib::Real periodFixing() const;

    //! The override for observation window \p i on date \p d, Null<Real>() if there is none
    QuantLib::Real overrideFor(QuantLib::Size i, const QuantLib::Date& d) const;

    const Fixings& fixings() const { return fixings_; }

private:
    Fixings fixings_;
    QuantLib::Real floatSpread_;
    SpreadCompoundMethod spreadCompoundMethod_;
};

} // namespace engine
} // namespace fpe
