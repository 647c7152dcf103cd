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

/*! \file fpe/curves/projectioncurve.hpp
    \brief Capability interface of the curves consumed by the period engine
    \ingroup curves
*/

#pragma once

#include <ql/shared_ptr.hpp>
#include <ql/time/calendar.hpp>
#include <ql/time/date.hpp>
#include <ql/time/daycounter.hpp>
#include <ql/types.hpp>

namespace fpe {
namespace engine {

//! Base class of the curves used to project reference rates and discount cashflows
/*! A curve carries the calendar and the day count convention of the rates it projects. Projection methods return
    QuantLib::Null<Real>() when the curve is unable to produce a value for the requested dates; callers decide
    whether that is an error.

    The derivative order is a capability flag owned by the caller. DiscountFactorCurve and RateCurve do not read it
    and return plain values at every order; the exposure table builder pins it to 0 while it runs, since its
    sensitivities are exact tangents of the compounding rather than curve derivatives. Changing the flag while
    another thread prices against the same curve is not supported: callers treat setDerivativeOrder() as an
    exclusive operation on the instance.

    \ingroup curves
*/
class ProjectionCurve {
public:
    ProjectionCurve(const QuantLib::Calendar& calendar, const QuantLib::DayCounter& dayCounter);
    virtual ~ProjectionCurve() {}

    //! \name Inspectors
    //@{
    const QuantLib::Calendar& calendar() const { return calendar_; }
    const QuantLib::DayCounter& dayCounter() const { return dayCounter_; }
    QuantLib::Size derivativeOrder() const { return derivativeOrder_; }
    //@}

    //! Simple rate in percent over [d1, d2] with accrual fraction measured by \p dc
    virtual QuantLib::Real forwardRate(const QuantLib::Date& d1, const QuantLib::Date& d2,
                                       const QuantLib::DayCounter& dc) const = 0;

    //! Set the numeric derivative order the curve is queried at, 0 means plain values
    void setDerivativeOrder(QuantLib::Size order);

private:
    QuantLib::Calendar calendar_;
    QuantLib::DayCounter dayCounter_;
    QuantLib::Size derivativeOrder_;
};

//! Sets the derivative order of a curve for the lifetime of the guard and restores the previous order afterwards
class DerivativeOrderGuard {
public:
    DerivativeOrderGuard(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve, QuantLib::Size order);
    ~DerivativeOrderGuard();

    DerivativeOrderGuard(const DerivativeOrderGuard&) = delete;
    DerivativeOrderGuard& operator=(const DerivativeOrderGuard&) = delete;

private:
    QuantLib::ext::shared_ptr<ProjectionCurve> curve_;
    QuantLib::Size previous_;
};

} // namespace engine
} // namespace fpe
