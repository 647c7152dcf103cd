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

/*! \file fpe/periods/period.hpp
    \brief Base classes of the periods of a swap leg and their cashflow report data
    \ingroup periods
*/

#pragma once

#include <fpe/curves/projectioncurve.hpp>
#include <fpe/utilities/fxrates.hpp>

#include <ql/time/calendars/nullcalendar.hpp>
#include <ql/time/daycounters/actual360.hpp>
#include <ql/time/frequency.hpp>

#include <boost/optional.hpp>

#include <string>

namespace fpe {
namespace engine {

//! Cashflow report data of a single period
/*! Fields that cannot be determined, e.g. because no curve was given or because the period type has no such
    attribute, are none.
    \ingroup periods
*/
struct PeriodCashflowReportData {
    std::string flowType;
    boost::optional<std::string> stubType;
    boost::optional<QuantLib::Date> accrualStartDate;
    boost::optional<QuantLib::Date> accrualEndDate;
    QuantLib::Date payDate;
    QuantLib::Real notional;
    std::string currency;
    boost::optional<std::string> convention;
    boost::optional<QuantLib::Real> accrual;
    boost::optional<QuantLib::Real> discountFactor;
    boost::optional<QuantLib::Real> rate;
    boost::optional<QuantLib::Real> spread;
    boost::optional<QuantLib::Real> amount;
    boost::optional<QuantLib::Real> presentValue;
    QuantLib::Real fxRateLocalBase;
    boost::optional<QuantLib::Real> presentValueBase;
};

//! Base class of all periods
/*! A period pays an amount in its currency on its payment date. The amount may depend on a projection curve, the
    present value is discounted on a DiscountFactorCurve which defaults to the projection curve. All values can be
    expressed in another currency either by a plain conversion factor or by an FxRates container and a target
    currency.

    \ingroup periods
*/
class BasePeriod {
public:
    BasePeriod(const QuantLib::Date& payment, QuantLib::Real notional, const std::string& currency);
    virtual ~BasePeriod() {}

    //! \name Inspectors
    //@{
    const QuantLib::Date& payment() const { return payment_; }
    QuantLib::Real notional() const { return notional_; }
    const std::string& currency() const { return currency_; }
    //@}

    //! The amount paid, none if it cannot be determined without a curve
    virtual boost::optional<QuantLib::Real>
    cashflow(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve = nullptr) const = 0;

    //! \name Valuation
    //@{
    //! Present value of the cashflow times \p fx
    QuantLib::Real npv(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                       const QuantLib::ext::shared_ptr<ProjectionCurve>& discountCurve = nullptr,
                       QuantLib::Real fx = 1.0) const;
    QuantLib::Real npv(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                       const QuantLib::ext::shared_ptr<ProjectionCurve>& discountCurve, const FxRates& fxRates,
                       const std::string& base = "") const;

    //! Change of the present value for a one basis point move of the rate, times \p fx
    QuantLib::Real analyticDelta(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                                 const QuantLib::ext::shared_ptr<ProjectionCurve>& discountCurve = nullptr,
                                 QuantLib::Real fx = 1.0) const;
    QuantLib::Real analyticDelta(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                                 const QuantLib::ext::shared_ptr<ProjectionCurve>& discountCurve,
                                 const FxRates& fxRates, const std::string& base = "") const;

    //! Report data, the value fields are none if no curve is given
    PeriodCashflowReportData cashflows(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve = nullptr,
                                       const QuantLib::ext::shared_ptr<ProjectionCurve>& discountCurve = nullptr,
                                       QuantLib::Real fx = 1.0) const;
    PeriodCashflowReportData cashflows(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                                       const QuantLib::ext::shared_ptr<ProjectionCurve>& discountCurve,
                                       const FxRates& fxRates, const std::string& base = "") const;
    //@}

    //! Discount factor of the payment date on \p discountCurve, or on \p curve if the former is null
    QuantLib::Real discountFactor(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                                  const QuantLib::ext::shared_ptr<ProjectionCurve>& discountCurve = nullptr) const;

protected:
    //! Type tag written to the report
    virtual std::string flowType() const = 0;
    //! Analytic delta in the period currency, given the discount factor of the payment date
    virtual QuantLib::Real localAnalyticDelta(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                                              QuantLib::Real discountFactor) const = 0;
    //! Fill the fields specific to the period type
    virtual void addReportData(PeriodCashflowReportData& data,
                               const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const {}

    QuantLib::Date payment_;
    QuantLib::Real notional_;
    std::string currency_;
};

//! Base class of periods accruing over [start, end]
/*! The day count fraction uses a reference period for conventions that need one: the period itself for regular
    periods, one frequency back from the end for front stubs and one frequency forward from the start for back
    stubs, i.e. stubs ending on the termination date.

    \ingroup periods
*/
class AccrualPeriod : public BasePeriod {
public:
    AccrualPeriod(const QuantLib::Date& start, const QuantLib::Date& end, const QuantLib::Date& payment,
                  QuantLib::Frequency frequency, QuantLib::Real notional = 1e6, const std::string& currency = "USD",
                  const QuantLib::DayCounter& dayCounter = QuantLib::Actual360(),
                  const QuantLib::Date& termination = QuantLib::Date(), bool stub = false);

    //! \name Inspectors
    //@{
    const QuantLib::Date& start() const { return start_; }
    const QuantLib::Date& end() const { return end_; }
    QuantLib::Frequency frequency() const { return frequency_; }
    const QuantLib::DayCounter& dayCounter() const { return dayCounter_; }
    const QuantLib::Date& termination() const { return termination_; }
    bool stub() const { return stub_; }
    QuantLib::Real dcf() const { return dcf_; }
    //@}

protected:
    void addReportData(PeriodCashflowReportData& data,
                       const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const override;
    //! N * dcf * df / 10000
    QuantLib::Real basisPointValue(QuantLib::Real discountFactor) const;

    QuantLib::Date start_, end_;
    QuantLib::Frequency frequency_;
    QuantLib::DayCounter dayCounter_;
    QuantLib::Date termination_;
    bool stub_;
    QuantLib::Real dcf_;
};

} // namespace engine
} // namespace fpe
