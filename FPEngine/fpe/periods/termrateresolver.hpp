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

/*! \file fpe/periods/termrateresolver.hpp
    \brief Resolution of the single fixing of a term (ibor) rate period
    \ingroup periods
*/

#pragma once

#include <fpe/curves/projectioncurve.hpp>
#include <fpe/periods/fixings.hpp>

#include <ql/time/frequency.hpp>

namespace fpe {
namespace engine {

//! Resolves the fixing of a term rate period
/*! The fixing date lies the given number of business days before the accrual start. The rate is
    - the single fixing if one is given,
    - the fixing on the fixing date if a series is given and contains it,
    - otherwise the value of a RateCurve on the fixing date, or the simple forward rate of a DiscountFactorCurve
      over the index tenor starting at the accrual start. For stubs the tenor ends at the accrual end.

    A vector of fixings is rejected, the period observes a single date.

    \ingroup periods
*/
class TermRateResolver {
public:
    TermRateResolver(const Fixings& fixings, QuantLib::Integer fixingDays);

    //! The fixing date for an accrual period starting on \p start
    QuantLib::Date fixingDate(const QuantLib::Date& start, const QuantLib::Calendar& calendar) const;

    //! End of the index tenor used to project the fixing from discount factors
    QuantLib::Date tenorEnd(const QuantLib::Date& start, const QuantLib::Date& end, QuantLib::Frequency frequency,
                            bool stub, const QuantLib::Calendar& calendar) const;

    //! The fixing excluding any spread, throws if it cannot be determined
    ResolvedFixing resolve(const QuantLib::Date& start, const QuantLib::Date& end, QuantLib::Frequency frequency,
                           bool stub, const QuantLib::DayCounter& dayCounter, const QuantLib::Calendar& calendar,
                           const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const;

    QuantLib::Integer fixingDays() const { return fixingDays_; }

private:
    Fixings fixings_;
    QuantLib::Integer fixingDays_;
};

} // namespace engine
} // namespace fpe
