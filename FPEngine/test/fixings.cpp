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

#include <boost/algorithm/string/predicate.hpp>
#include <boost/test/unit_test.hpp>
#include <fpe/periods/fixings.hpp>
#include <fpet/toplevelfixture.hpp>
#include <ql/utilities/null.hpp>

#include "testcurves.hpp"

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace std;
using namespace fpe::engine;

using fpe::test::LogCapture;
using fpe::test::TopLevelFixture;

namespace {

// daily schedule over [start, end], all days are business days
ObservationSchedule daily(const Date& start, const Date& end) {
    return buildObservationSchedule(FixingMethod::RfrPaymentDelay, 0, start, end, NullCalendar(), Actual365Fixed());
}

void checkRates(const vector<ResolvedFixing>& result, const vector<Real>& rates, const vector<FixingSource>& sources) {
    BOOST_REQUIRE_EQUAL(result.size(), rates.size());
    for (Size i = 0; i < rates.size(); ++i) {
        BOOST_CHECK_CLOSE(result[i].rate, rates[i], 1e-10);
        BOOST_CHECK_MESSAGE(result[i].source == sources[i], "fixing " << i << " on " << result[i].date
                                                                       << " has source " << result[i].source
                                                                       << ", expected " << sources[i]);
    }
}

const FixingSource O = FixingSource::Override;
const FixingSource C = FixingSource::Curve;

} // namespace

BOOST_FIXTURE_TEST_SUITE(FPEngineTestSuite, TopLevelFixture)

BOOST_AUTO_TEST_SUITE(FixingsTests)

BOOST_AUTO_TEST_CASE(testFixingSeries) {

    BOOST_TEST_MESSAGE("Testing fixing series...");

    FixingSeries s({Date(1, December, 1995), Date(30, December, 2021)}, {99.0, 1.5});
    BOOST_CHECK_EQUAL(s.size(), 2u);
    BOOST_CHECK(s.isIncreasing());
    BOOST_CHECK_EQUAL(s.lastDate(), Date(30, December, 2021));
    BOOST_CHECK_CLOSE(s.find(Date(30, December, 2021)), 1.5, 1e-12);
    BOOST_CHECK(s.find(Date(31, December, 2021)) == Null<Real>());

    s.add(Date(29, December, 2021), 2.0);
    BOOST_CHECK(!s.isIncreasing());
    BOOST_CHECK_THROW(checkFixingSeries(s), Error);

    vector<Date> dates = {Date(1, December, 1995)};
    vector<Real> values = {1.0, 2.0};
    BOOST_CHECK_THROW(FixingSeries(dates, values), Error);
    BOOST_CHECK_THROW(FixingSeries().lastDate(), Error);
}

BOOST_AUTO_TEST_CASE(testCurveProjection) {

    BOOST_TEST_MESSAGE("Testing rates projected from the curves...");

    ObservationSchedule s = daily(Date(1, January, 2022), Date(4, January, 2022));
    FixingResolver resolver{Fixings()};

    checkRates(resolver.resolveAll(s, fpe::test::lineCurve()), {1.0, 2.0, 3.0}, {C, C, C});
    checkRates(resolver.resolveAll(s, fpe::test::overnightCurve()), {1.0, 2.0, 3.0}, {C, C, C});
}

BOOST_AUTO_TEST_CASE(testVectorOverridesFirstDates) {

    BOOST_TEST_MESSAGE("Testing a vector of fixings...");

    ObservationSchedule s = daily(Date(1, January, 2022), Date(4, January, 2022));
    FixingResolver resolver(vector<Real>{10.0, 8.0});
    checkRates(resolver.resolveAll(s, fpe::test::lineCurve()), {10.0, 8.0, 3.0}, {O, O, C});

    FixingResolver tooMany(vector<Real>{1.0, 2.0, 3.0, 4.0});
    BOOST_CHECK_EXCEPTION(tooMany.resolve(s, fpe::test::lineCurve()), Error, [](const Error& e) {
        return string(e.what()).find("more fixings than observation dates") != string::npos;
    });
}

BOOST_AUTO_TEST_CASE(testSeriesLookup) {

    BOOST_TEST_MESSAGE("Testing a series of historical fixings...");

    LogCapture capture;

    FixingSeries series({Date(1, January, 1995), Date(29, December, 2021), Date(30, December, 2021),
                         Date(31, December, 2021)},
                        {99.0, 99.0, 1.5, 2.5});
    ObservationSchedule s = daily(Date(30, December, 2021), Date(3, January, 2022));
    FixingResolver resolver(series, 100.0);
    checkRates(resolver.resolveAll(s, fpe::test::lineCurve()), {1.5, 2.5, 1.0, 2.0}, {O, O, C, C});

    // dates after the last fixing are expected to be projected
    BOOST_CHECK_EQUAL(capture.warnings(), 0u);
}

BOOST_AUTO_TEST_CASE(testSeriesMissingDateWarns) {

    BOOST_TEST_MESSAGE("Testing that a gap in historical fixings warns exactly once...");

    LogCapture capture;

    FixingSeries series({Date(1, December, 1995), Date(30, December, 2021), Date(1, January, 2022)},
                        {99.0, 99.0, 2.5});
    ObservationSchedule s = daily(Date(30, December, 2021), Date(3, January, 2022));
    FixingResolver resolver(series, 100.0);

    // 31 Dec 2021 is missing and taken from the curve
    vector<ResolvedFixing> result = resolver.resolveAll(s, fpe::test::lineCurve());
    checkRates(result, {99.0, -99.0, 2.5, 2.0}, {O, C, O, C});

    vector<string> messages = capture.messages();
    BOOST_REQUIRE_EQUAL(messages.size(), 1u);
    BOOST_CHECK(boost::contains(messages[0], "StructuredWarningMessage"));
    BOOST_CHECK(boost::contains(messages[0], "2021-12-31"));
}

BOOST_AUTO_TEST_CASE(testSeriesMustBeIncreasing) {

    BOOST_TEST_MESSAGE("Testing that a series of fixings must be increasing...");

    FixingSeries series({Date(1, December, 1995), Date(30, December, 2021), Date(31, December, 2022),
                         Date(1, January, 2022)},
                        {99.0, 2.25, 2.375, 2.5});
    ObservationSchedule s = daily(Date(30, December, 2021), Date(3, January, 2022));
    FixingResolver resolver(series, 100.0);
    BOOST_CHECK_EXCEPTION(resolver.resolve(s, fpe::test::quarterlyCurve()), Error, [](const Error& e) {
        return string(e.what()).find("`fixings` as a series must be increasing") != string::npos;
    });
}

BOOST_AUTO_TEST_CASE(testMissingRates) {

    BOOST_TEST_MESSAGE("Testing unresolved observation dates...");

    ObservationSchedule s = daily(Date(28, December, 2022), Date(2, January, 2023));

    // no curve
    FixingResolver partial(vector<Real>{1.19, 1.19});
    vector<ResolvedFixing> result = partial.resolve(s, nullptr);
    BOOST_CHECK(result[1].source == FixingSource::Override);
    BOOST_CHECK(result[2].source == FixingSource::Missing);
    BOOST_CHECK_EXCEPTION(partial.resolveAll(s, nullptr), Error, [](const Error& e) {
        return string(e.what()).find("rates could not be calculated") != string::npos;
    });

    // a curve without values before 2023
    RateCurve::Interpolator interp = [](const Date& d, const vector<Date>&, const vector<Real>&) {
        return d < Date(1, January, 2023) ? Null<Real>() : 2.0;
    };
    auto curve = QuantLib::ext::make_shared<RateCurve>(vector<Date>{Date(1, January, 2023), Date(1, February, 2023)},
                                                       vector<Real>{3.0, 2.0}, Actual360(), NullCalendar(), interp);
    BOOST_CHECK_EXCEPTION(partial.resolveAll(s, curve), Error, [](const Error& e) {
        return string(e.what()).find("RFRs could not be calculated") != string::npos;
    });

    // fully overridden periods need no curve
    FixingResolver full(vector<Real>{1.0, 2.0, 3.0, 4.0, 5.0});
    checkRates(full.resolveAll(s, nullptr), {1.0, 2.0, 3.0, 4.0, 5.0}, {O, O, O, O, O});
}

BOOST_AUTO_TEST_CASE(testLockedWindowsAreNotProjected) {

    BOOST_TEST_MESSAGE("Testing that locked observation windows are not projected...");

    // five windows from 28 Dec 2022, the last one on 1 Jan 2023 is locked
    ObservationSchedule s = buildObservationSchedule(FixingMethod::RfrLockout, 1, Date(28, December, 2022),
                                                     Date(2, January, 2023), NullCalendar(), Actual360());
    BOOST_REQUIRE_EQUAL(s.size(), 5u);

    // a curve without values from 2023
    RateCurve::Interpolator interp = [](const Date& d, const vector<Date>&, const vector<Real>&) {
        return d < Date(1, January, 2023) ? 2.0 : Null<Real>();
    };
    auto curve = QuantLib::ext::make_shared<RateCurve>(vector<Date>{Date(1, December, 2022), Date(31, December, 2022)},
                                                       vector<Real>{2.0, 2.0}, Actual360(), NullCalendar(), interp);

    vector<ResolvedFixing> result = FixingResolver(Fixings()).resolveAll(s, curve);
    BOOST_REQUIRE_EQUAL(result.size(), 5u);
    for (Size i = 0; i < 4; ++i) {
        BOOST_CHECK(result[i].source == C);
        BOOST_CHECK_CLOSE(result[i].rate, 2.0, 1e-12);
    }
    BOOST_CHECK(result[4].source == FixingSource::Unobserved);
    BOOST_CHECK_EQUAL(result[4].date, Date(1, January, 2023));

    // overrides for the windows in use determine every rate of the period
    BOOST_CHECK(FixingResolver(vector<Real>{1.0, 2.0, 3.0, 4.0}).determinesRates(s));
    BOOST_CHECK(!FixingResolver(vector<Real>{1.0, 2.0, 3.0}).determinesRates(s));
    BOOST_CHECK(!FixingResolver(Fixings()).determinesRates(s));
    BOOST_CHECK(FixingResolver(Real(2.5)).determinesRates(s));
}

BOOST_AUTO_TEST_CASE(testSingleFixing) {

    BOOST_TEST_MESSAGE("Testing a single fixing...");

    ObservationSchedule s = daily(Date(1, January, 2022), Date(4, January, 2022));
    FixingResolver resolver(Real(7.5));
    BOOST_CHECK(resolver.fixesPeriod());
    BOOST_CHECK_CLOSE(resolver.periodFixing(), 7.5, 1e-12);
    checkRates(resolver.resolveAll(s, nullptr), {7.5, 7.5, 7.5}, {O, O, O});

    FixingResolver none{Fixings()};
    BOOST_CHECK(!none.fixesPeriod());
    BOOST_CHECK(none.periodFixing() == Null<Real>());
    BOOST_CHECK(none.overrideFor(0, Date(1, January, 2022)) == Null<Real>());
}

BOOST_AUTO_TEST_CASE(testSpreadOnOverrideWarns) {

    BOOST_TEST_MESSAGE("Testing the warning for a spread compounded on top of fixings...");

    LogCapture capture;
    ObservationSchedule s = daily(Date(1, January, 2022), Date(4, January, 2022));
    auto curve = fpe::test::lineCurve();

    FixingResolver(vector<Real>{1.0}, 100.0, SpreadCompoundMethod::IsdaCompounding).resolveAll(s, curve);
    BOOST_CHECK_EQUAL(capture.warnings(), 1u);

    FixingResolver(vector<Real>{1.0}, 0.0, SpreadCompoundMethod::IsdaCompounding).resolveAll(s, curve);
    FixingResolver(vector<Real>{1.0}, 100.0, SpreadCompoundMethod::NoneSimple).resolveAll(s, curve);
    FixingResolver(Fixings(), 100.0, SpreadCompoundMethod::IsdaCompounding).resolveAll(s, curve);
    BOOST_CHECK_EQUAL(capture.warnings(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
