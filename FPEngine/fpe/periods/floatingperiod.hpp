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

/*! \file fpe/periods/floatingperiod.hpp
    \brief Floating rate period on an overnight or a term reference rate
    \ingroup periods
*/

#pragma once

#include <fpe/periods/exposuretable.hpp>
#include <fpe/periods/fixings.hpp>
#include <fpe/periods/period.hpp>
#include <fpe/periods/types.hpp>

#include <ql/time/calendar.hpp>

#include <boost/optional.hpp>

namespace fpe {
namespace engine {

//! Rate configuration of a floating period
/*! \ingroup periods
 */
struct FloatingPeriodConfig {
    FloatingPeriodConfig()
        : fixingMethod(FixingMethod::RfrPaymentDelay), methodParam(0),
          spreadCompoundMethod(SpreadCompoundMethod::NoneSimple), floatSpread(0.0) {}

    FixingMethod fixingMethod;
    //! Business days of lockout, lookback or observation shift, fixing days for ibor
    QuantLib::Integer methodParam;
    SpreadCompoundMethod spreadCompoundMethod;
    //! Spread in basis points
    QuantLib::Real floatSpread;
    Fixings fixings;
    //! Calendar of the observation dates, the curve calendar is used if none is given
    boost::optional<QuantLib::Calendar> calendar;
};

//! Floating rate period
/*! The period rate is either a compounded overnight rate, observed according to one of the rfr fixing methods, or a
    term rate fixed before the start of the period. Rates are projected from a DiscountFactorCurve or a RateCurve
    unless they are given as fixings.

    The period is complex if the exposure of an observation date depends on the rates of other dates beyond the
    compounded product, which is the case for lockout and lookback and for every spread compounding method other
    than none_simple. The exposure table of a complex period is built by propagating the sensitivity through the
    full compounding chain.

    The configuration is validated on construction, invalid configurations are logged as structured configuration
    errors before the exception is raised. The setters do not validate, an invalid method assigned through them
    raises an error when the rate is computed.

    \ingroup periods
*/
class FloatingPeriod : public AccrualPeriod {
public:
    FloatingPeriod(const QuantLib::Date& start, const QuantLib::Date& end, const QuantLib::Date& payment,
                   QuantLib::Frequency frequency, const FloatingPeriodConfig& config = FloatingPeriodConfig(),
                   QuantLib::Real notional = 1e6, const std::string& currency = "USD",
                   const QuantLib::DayCounter& dayCounter = QuantLib::Actual360(),
                   const QuantLib::Date& termination = QuantLib::Date(), bool stub = false);

    //! \name Inspectors
    //@{
    const FloatingPeriodConfig& config() const { return config_; }
    FixingMethod fixingMethod() const { return config_.fixingMethod; }
    SpreadCompoundMethod spreadCompoundMethod() const { return config_.spreadCompoundMethod; }
    QuantLib::Real floatSpread() const { return config_.floatSpread; }
    bool isComplex() const;
    //@}

    //! \name Modifiers
    //@{
    void setFloatSpread(QuantLib::Real floatSpread) { config_.floatSpread = floatSpread; }
    void setSpreadCompoundMethod(SpreadCompoundMethod m) { config_.spreadCompoundMethod = m; }
    void setFixingMethod(FixingMethod m) { config_.fixingMethod = m; }
    //@}

    //! The period rate in percent including the spread
    /*! Throws if \p curve is neither a DiscountFactorCurve nor a RateCurve, or if a rate that is not given as a
        fixing cannot be projected.
    */
    QuantLib::Real rate(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve = nullptr) const;

    //! -N * dcf * rate / 100, none if no curve is given and the fixings do not determine the rate
    boost::optional<QuantLib::Real>
    cashflow(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve = nullptr) const override;

    //! Exposure per observation date
    /*! \param fixingExposure append a row with the period cashflow as notional and the period rate */
    ExposureTable fixingsTable(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                               bool fixingExposure = false) const;

    //! The observation schedule of an rfr period given the projection curve
    ObservationSchedule observationSchedule(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const;

protected:
    std::string flowType() const override { return "FloatPeriod"; }
    //! N * dcf * df / 10000, times the derivative of the rate with respect to a non-zero compounded spread
    QuantLib::Real localAnalyticDelta(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                                      QuantLib::Real discountFactor) const override;
    void addReportData(PeriodCashflowReportData& data,
                       const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const override;

private:
    void validate() const;
    QuantLib::Calendar observationCalendar(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const;
    QuantLib::DayCounter observationDayCounter(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const;
    // step rates of the compounding, one per accrual window
    std::vector<QuantLib::Real> compoundingRates(const ObservationSchedule& schedule, const FixingResolver& resolver,
                                                 const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const;
    bool determinedByFixings() const;

    FloatingPeriodConfig config_;
};

} // namespace engine
} // namespace fpe
