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

#include <fpe/curves/curvecheck.hpp>
#include <fpe/periods/period.hpp>
#include <fpe/utilities/parsers.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <ql/errors.hpp>
#include <ql/io.hpp>
#include <ql/time/period.hpp>
#include <ql/utilities/null.hpp>

using namespace QuantLib;

namespace fpe {
namespace engine {

BasePeriod::BasePeriod(const Date& payment, Real notional, const std::string& currency)
    : payment_(payment), notional_(notional), currency_(boost::to_upper_copy(currency)) {
    QL_REQUIRE(payment_ != Date(), "BasePeriod: payment date must be set");
}

Real BasePeriod::discountFactor(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                            const QuantLib::ext::shared_ptr<ProjectionCurve>& discountCurve) const {
    auto disc = discountFactorCurve(discountCurve ? discountCurve : curve);
    Real df = disc->discountFactor(payment_);
    QL_REQUIRE(df != Null<Real>(), "no discount factor for payment date " << io::iso_date(payment_));
    return df;
}

Real BasePeriod::npv(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                 const QuantLib::ext::shared_ptr<ProjectionCurve>& discountCurve, Real fx) const {
    boost::optional<Real> amount = cashflow(curve);
    QL_REQUIRE(amount, "rates could not be calculated: the cashflow of the " << flowType() << " paying on "
                                                                             << io::iso_date(payment_)
                                                                             << " requires a curve");
    return *amount * discountFactor(curve, discountCurve) * fx;
}

Real BasePeriod::npv(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                 const QuantLib::ext::shared_ptr<ProjectionCurve>& discountCurve, const FxRates& fxRates,
                 const std::string& base) const {
    return npv(curve, discountCurve, fxRates.conversion(currency_, base));
}

Real BasePeriod::analyticDelta(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                           const QuantLib::ext::shared_ptr<ProjectionCurve>& discountCurve, Real fx) const {
    return localAnalyticDelta(curve, discountFactor(curve, discountCurve)) * fx;
}

Real BasePeriod::analyticDelta(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                           const QuantLib::ext::shared_ptr<ProjectionCurve>& discountCurve, const FxRates& fxRates,
                           const std::string& base) const {
    return analyticDelta(curve, discountCurve, fxRates.conversion(currency_, base));
}

PeriodCashflowReportData BasePeriod::cashflows(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                                           const QuantLib::ext::shared_ptr<ProjectionCurve>& discountCurve,
                                           Real fx) const {
    PeriodCashflowReportData data;
    data.flowType = flowType();
    data.payDate = payment_;
    data.notional = notional_;
    data.currency = currency_;
    data.fxRateLocalBase = fx;

    // the period type may already have derived the amount from the reported rate
    addReportData(data, curve);
    if (!data.amount)
        data.amount = cashflow(curve);

    if (curve || discountCurve) {
        data.discountFactor = discountFactor(curve, discountCurve);
        if (data.amount) {
            data.presentValue = *data.amount * *data.discountFactor;
            data.presentValueBase = *data.presentValue * fx;
        }
    }
    return data;
}

PeriodCashflowReportData BasePeriod::cashflows(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                                           const QuantLib::ext::shared_ptr<ProjectionCurve>& discountCurve,
                                           const FxRates& fxRates, const std::string& base) const {
    return cashflows(curve, discountCurve, fxRates.conversion(currency_, base));
}

AccrualPeriod::AccrualPeriod(const Date& start, const Date& end, const Date& payment, Frequency frequency,
                             Real notional, const std::string& currency, const DayCounter& dayCounter,
                             const Date& termination, bool stub)
    : BasePeriod(payment, notional, currency), start_(start), end_(end), frequency_(frequency),
      dayCounter_(dayCounter), termination_(termination == Date() ? end : termination), stub_(stub) {
    QL_REQUIRE(start_ < end_, "`end` (" << io::iso_date(end_) << ") must be after `start` ("
                                        << io::iso_date(start_) << ")");
    QL_REQUIRE(!dayCounter_.empty(), "AccrualPeriod: day counter must not be empty");

    Date refStart = start_, refEnd = end_;
    if (stub_ && frequency_ != Once && frequency_ != NoFrequency) {
        if (end_ == termination_)
            refEnd = start_ + QuantLib::Period(frequency_);
        else
            refStart = end_ - QuantLib::Period(frequency_);
    }
    dcf_ = dayCounter_.yearFraction(start_, end_, refStart, refEnd);
}

void AccrualPeriod::addReportData(PeriodCashflowReportData& data,
                                  const QuantLib::ext::shared_ptr<ProjectionCurve>&) const {
    data.stubType = stub_ ? "Stub" : "Regular";
    data.accrualStartDate = start_;
    data.accrualEndDate = end_;
    data.convention = dayCounterTag(dayCounter_);
    data.accrual = dcf_;
}

Real AccrualPeriod::basisPointValue(Real discountFactor) const {
    return notional_ * dcf_ * discountFactor / 10000.0;
}

} // namespace engine
} // namespace fpe
