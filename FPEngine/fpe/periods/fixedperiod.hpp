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

/*! \file fpe/periods/fixedperiod.hpp
    \brief Fixed rate period and bare cashflow
    \ingroup periods
*/

#pragma once

#include <fpe/periods/period.hpp>

namespace fpe {
namespace engine {

//! Period paying a fixed rate in percent
/*! The rate may be left unset, e.g. while a leg is being solved for its par rate. The cashflow is then none.
    \ingroup periods
*/
class FixedPeriod : public AccrualPeriod {
public:
    FixedPeriod(const QuantLib::Date& start, const QuantLib::Date& end, const QuantLib::Date& payment,
                QuantLib::Frequency frequency, const boost::optional<QuantLib::Real>& fixedRate = boost::none,
                QuantLib::Real notional = 1e6, const std::string& currency = "USD",
                const QuantLib::DayCounter& dayCounter = QuantLib::Actual360(),
                const QuantLib::Date& termination = QuantLib::Date(), bool stub = false);

    const boost::optional<QuantLib::Real>& fixedRate() const { return fixedRate_; }
    void setFixedRate(const boost::optional<QuantLib::Real>& fixedRate) { fixedRate_ = fixedRate; }

    //! -N * dcf * rate / 100, none if the rate is unset
    boost::optional<QuantLib::Real>
    cashflow(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve = nullptr) const override;

protected:
    std::string flowType() const override { return "FixedPeriod"; }
    QuantLib::Real localAnalyticDelta(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                                      QuantLib::Real discountFactor) const override;
    void addReportData(PeriodCashflowReportData& data,
                       const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const override;

private:
    boost::optional<QuantLib::Real> fixedRate_;
};

//! A single payment of -notional without accrual
/*! \ingroup periods
 */
class Cashflow : public BasePeriod {
public:
    Cashflow(QuantLib::Real notional, const QuantLib::Date& payment, const std::string& currency = "USD");

    boost::optional<QuantLib::Real>
    cashflow(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve = nullptr) const override;

protected:
    std::string flowType() const override { return "Cashflow"; }
    //! A bare cashflow has no rate risk
    QuantLib::Real localAnalyticDelta(const QuantLib::ext::shared_ptr<ProjectionCurve>&,
                                      QuantLib::Real) const override {
        return 0.0;
    }
};

} // namespace engine
} // namespace fpe
