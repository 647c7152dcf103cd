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

#include <boost/test/unit_test.hpp>
#include <fpe/periods/fixedperiod.hpp>
#include <fpet/toplevelfixture.hpp>
#include <ql/time/daycounters/actualactual.hpp>

#include "testcurves.hpp"

#include <map>

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace std;
using namespace fpe::engine;

using fpe::test::TopLevelFixture;

namespace {

// 1 Jan 2022 to 1 Apr 2022 on 1bn, paid on 3 Apr 2022
FixedPeriod quarterPeriod(const boost::optional<Real>& rate = boost::none) {
    return FixedPeriod(Date(1, January, 2022), Date(1, April, 2022), Date(3, April, 2022), Quarterly, rate, 1e9, "usd",
                       Actual360(), Date(1, April, 2022));
}

const Real paymentDiscount = 0.9897791268897856;

} // namespace

BOOST_FIXTURE_TEST_SUITE(FPEngineTestSuite, TopLevelFixture)

BOOST_AUTO_TEST_SUITE(FixedPeriodTests)

BOOST_AUTO_TEST_CASE(testAnalyticDelta) {

    BOOST_TEST_MESSAGE("Testing the analytic delta of a fixed period...");

    auto curve = fpe::test::quarterlyCurve();
    FixedPeriod period = quarterPeriod();
    BOOST_CHECK_EQUAL(period.currency(), "USD");
    BOOST_CHECK_SMALL(period.analyticDelta(curve) - 24744.478172244584, 1e-7);

    FxRates fxr(map<string, Real>{{"usdnok", 10.0}});
    BOOST_CHECK_SMALL(period.analyticDelta(curve, curve, fxr, "nok") - 247444.78172244584, 1e-6);

    FxRates nokBase(map<string, Real>{{"usdnok", 10.0}}, "NOK");
    BOOST_CHECK_SMALL(period.analyticDelta(curve, curve, nokBase) - 247444.78172244584, 1e-6);
}

BOOST_AUTO_TEST_CASE(testNpv) {

    BOOST_TEST_MESSAGE("Testing the npv of a fixed period...");

    auto curve = fpe::test::quarterlyCurve();
    FixedPeriod period = quarterPeriod(4.0);
    BOOST_CHECK_SMALL(period.npv(curve) + 9897791.268897833, 1e-7);

    FxRates fxr(map<string, Real>{{"usdnok", 10.0}});
    BOOST_CHECK_SMALL(period.npv(curve, curve, fxr, "nok") + 98977912.68897833, 1e-6);

    // the discount curve takes precedence over the projection curve
    vector<Date> dates = {Date(1, January, 2022), Date(1, January, 2023)};
    vector<Real> dfs = {1.0, 0.5};
    auto disc = QuantLib::ext::make_shared<DiscountFactorCurve>(dates, dfs);
    BOOST_CHECK_CLOSE(period.npv(curve, disc), -1e7 * disc->discountFactor(Date(3, April, 2022)), 1e-10);

    // an unset rate cannot be valued
    FixedPeriod unset = quarterPeriod();
    BOOST_CHECK(!unset.cashflow());
    BOOST_CHECK_THROW(unset.npv(curve), Error);
    unset.setFixedRate(4.0);
    BOOST_CHECK_SMALL(unset.npv(curve) + 9897791.268897833, 1e-7);
}

BOOST_AUTO_TEST_CASE(testCashflowReport) {

    BOOST_TEST_MESSAGE("Testing the cashflow report of a fixed period...");

    auto curve = fpe::test::quarterlyCurve();
    FxRates fxr(map<string, Real>{{"usdnok", 10.0}});

    for (bool priced : {true, false}) {
        for (bool withFxRates : {false, true}) {
            boost::optional<Real> rate;
            QuantLib::ext::shared_ptr<ProjectionCurve> c;
            if (priced) {
                rate = 4.0;
                c = curve;
            }
            FixedPeriod period = quarterPeriod(rate);
            Real fx = withFxRates ? 10.0 : 2.0;
            PeriodCashflowReportData data =
                withFxRates ? period.cashflows(c, nullptr, fxr, "nok") : period.cashflows(c, nullptr, 2.0);

            BOOST_CHECK_EQUAL(data.flowType, "FixedPeriod");
            BOOST_CHECK_EQUAL(*data.stubType, "Regular");
            BOOST_CHECK_EQUAL(*data.accrualStartDate, Date(1, January, 2022));
            BOOST_CHECK_EQUAL(*data.accrualEndDate, Date(1, April, 2022));
            BOOST_CHECK_EQUAL(data.payDate, Date(3, April, 2022));
            BOOST_CHECK_EQUAL(data.notional, 1e9);
            BOOST_CHECK_EQUAL(data.currency, "USD");
            BOOST_CHECK_EQUAL(*data.convention, "Act360");
            BOOST_CHECK_CLOSE(*data.accrual, period.dcf(), 1e-12);
            BOOST_CHECK(!data.spread);
            BOOST_CHECK_EQUAL(data.fxRateLocalBase, fx);
            if (priced) {
                BOOST_CHECK_EQUAL(*data.rate, 4.0);
                BOOST_CHECK_CLOSE(*data.amount, -1e7, 1e-12);
                BOOST_CHECK_CLOSE(*data.discountFactor, paymentDiscount, 1e-10);
                BOOST_CHECK_CLOSE(*data.presentValue, -9897791.268897858, 1e-10);
                BOOST_CHECK_CLOSE(*data.presentValueBase, -9897791.268897858 * fx, 1e-10);
            } else {
                BOOST_CHECK(!data.rate);
                BOOST_CHECK(!data.amount);
                BOOST_CHECK(!data.discountFactor);
                BOOST_CHECK(!data.presentValue);
                BOOST_CHECK(!data.presentValueBase);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(testStubAccrual) {

    BOOST_TEST_MESSAGE("Testing the accrual of stub periods...");

    FixedPeriod regular(Date(15, January, 2022), Date(15, April, 2022), Date(15, April, 2022), Quarterly, 1.0);
    BOOST_CHECK_CLOSE(regular.dcf(), 90.0 / 360.0, 1e-12);
    BOOST_CHECK(!regular.stub());

    // ISMA accrual measures a stub against a full reference period
    FixedPeriod front(Date(15, February, 2022), Date(15, April, 2022), Date(15, April, 2022), Quarterly, 1.0, 1e6,
                      "USD", ActualActual(ActualActual::ISMA), Date(15, January, 2023), true);
    BOOST_CHECK(front.stub());
    BOOST_CHECK_CLOSE(front.dcf(), 59.0 / 90.0 * 0.25, 1e-10);
    BOOST_CHECK_EQUAL(*front.cashflows().stubType, "Stub");

    FixedPeriod back(Date(15, January, 2022), Date(15, March, 2022), Date(15, March, 2022), Quarterly, 1.0, 1e6,
                     "USD", ActualActual(ActualActual::ISMA), Date(15, March, 2022), true);
    BOOST_CHECK_CLOSE(back.dcf(), 59.0 / 90.0 * 0.25, 1e-10);
}

BOOST_AUTO_TEST_CASE(testDatesMustBeOrdered) {

    BOOST_TEST_MESSAGE("Testing that a period must end after it starts...");

    BOOST_CHECK_EXCEPTION(
        FixedPeriod(Date(1, January, 2023), Date(1, January, 2022), Date(1, January, 2024), Quarterly), Error,
        [](const Error& e) { return string(e.what()).find("must be after `start`") != string::npos; });
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CashflowTests)

BOOST_AUTO_TEST_CASE(testAnalyticDelta) {

    BOOST_TEST_MESSAGE("Testing the analytic delta of a cashflow...");

    Cashflow cashflow(1e6, Date(1, January, 2022));
    BOOST_CHECK_EQUAL(cashflow.analyticDelta(fpe::test::quarterlyCurve()), 0.0);
}

BOOST_AUTO_TEST_CASE(testCashflowReport) {

    BOOST_TEST_MESSAGE("Testing the cashflow report of a cashflow...");

    auto curve = fpe::test::quarterlyCurve();
    FxRates fxr(map<string, Real>{{"usdnok", 10.0}});
    Cashflow cashflow(1e9, Date(3, April, 2022));

    for (bool priced : {true, false}) {
        for (bool withFxRates : {false, true}) {
            QuantLib::ext::shared_ptr<ProjectionCurve> c = priced ? curve : nullptr;
            Real fx = withFxRates ? 10.0 : 2.0;
            PeriodCashflowReportData data =
                withFxRates ? cashflow.cashflows(c, nullptr, fxr, "nok") : cashflow.cashflows(c, nullptr, 2.0);

            BOOST_CHECK_EQUAL(data.flowType, "Cashflow");
            BOOST_CHECK(!data.stubType);
            BOOST_CHECK(!data.accrualStartDate);
            BOOST_CHECK(!data.accrualEndDate);
            BOOST_CHECK_EQUAL(data.payDate, Date(3, April, 2022));
            BOOST_CHECK_EQUAL(data.currency, "USD");
            BOOST_CHECK_EQUAL(data.notional, 1e9);
            BOOST_CHECK(!data.convention);
            BOOST_CHECK(!data.accrual);
            BOOST_CHECK(!data.rate);
            BOOST_CHECK(!data.spread);
            BOOST_CHECK_EQUAL(*data.amount, -1e9);
            BOOST_CHECK_EQUAL(data.fxRateLocalBase, fx);
            if (priced) {
                BOOST_CHECK_CLOSE(*data.discountFactor, paymentDiscount, 1e-10);
                BOOST_CHECK_CLOSE(*data.presentValue, -989779126.8897856, 1e-10);
                BOOST_CHECK_CLOSE(*data.presentValueBase, -989779126.8897856 * fx, 1e-10);
            } else {
                BOOST_CHECK(!data.discountFactor);
                BOOST_CHECK(!data.presentValue);
            }
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
