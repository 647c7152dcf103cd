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

#include <fpe/periods/fixings.hpp>
#include <fpe/periods/structuredperiodmessage.hpp>
#include <fpe/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/io.hpp>
#include <ql/utilities/null.hpp>

#include <algorithm>
#include <sstream>

using namespace QuantLib;
using std::string;
using std::vector;

namespace fpe {
namespace engine {

FixingSeries::FixingSeries(const vector<Date>& dates, const vector<Real>& values) {
    QL_REQUIRE(dates.size() == values.size(),
               "FixingSeries: " << dates.size() << " dates but " << values.size() << " values");
    for (Size i = 0; i < dates.size(); ++i)
        add(dates[i], values[i]);
}

bool FixingSeries::isIncreasing() const {
    for (Size i = 1; i < data_.size(); ++i) {
        if (data_[i].first <= data_[i - 1].first)
            return false;
    }
    return true;
}

const Date& FixingSeries::lastDate() const {
    QL_REQUIRE(!data_.empty(), "FixingSeries: no last date in an empty series");
    return data_.back().first;
}

Real FixingSeries::find(const Date& d) const {
    auto it = std::find_if(data_.begin(), data_.end(),
                           [&d](const std::pair<Date, Real>& p) { return p.first == d; });
    return it == data_.end() ? Null<Real>() : it->second;
}

std::ostream& operator<<(std::ostream& out, const FixingSource& s) {
    switch (s) {
    case FixingSource::Override:
        return out << "Override";
    case FixingSource::Curve:
        return out << "Curve";
    case FixingSource::Missing:
        return out << "Missing";
    case FixingSource::Unobserved:
        return out << "Unobserved";
    default:
        return out << "Unknown FixingSource (" << static_cast<int>(s) << ")";
    }
}

void checkFixingSeries(const FixingSeries& series) {
    QL_REQUIRE(series.isIncreasing(), "`fixings` as a series must be increasing, got " << series.size()
                                                                                        << " fixings out of order");
}

FixingResolver::FixingResolver(const Fixings& fixings, Real floatSpread, SpreadCompoundMethod spreadCompoundMethod)
    : fixings_(fixings), floatSpread_(floatSpread), spreadCompoundMethod_(spreadCompoundMethod) {}

bool FixingResolver::fixesPeriod() const { return boost::get<Real>(&fixings_) != nullptr; }

Real FixingResolver::periodFixing() const {
    const Real* r = boost::get<Real>(&fixings_);
    return r ? *r : Null<Real>();
}

Real FixingResolver::overrideFor(Size i, const Date& d) const {
    if (const Real* r = boost::get<Real>(&fixings_))
        return *r;
    if (const vector<Real>* v = boost::get<vector<Real>>(&fixings_))
        return i < v->size() ? (*v)[i] : Null<Real>();
    if (const FixingSeries* s = boost::get<FixingSeries>(&fixings_))
        return s->find(d);
    return Null<Real>();
}

namespace {
// windows used by at least one compounding step
vector<bool> observedWindows(const ObservationSchedule& schedule) {
    vector<bool> observed(schedule.observationDcfs.size(), false);
    for (Size k : schedule.rateIndex)
        observed[k] = true;
    return observed;
}
} // namespace

bool FixingResolver::determinesRates(const ObservationSchedule& schedule) const {
    if (fixesPeriod())
        return true;
    vector<bool> observed = observedWindows(schedule);
    for (Size i = 0; i < observed.size(); ++i) {
        if (observed[i] && overrideFor(i, schedule.observationDates[i]) == Null<Real>())
            return false;
    }
    return true;
}

vector<ResolvedFixing> FixingResolver::resolve(const ObservationSchedule& schedule,
                                               const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const {
    Size n = schedule.observationDcfs.size();

    const FixingSeries* series = boost::get<FixingSeries>(&fixings_);
    if (series)
        checkFixingSeries(*series);
    if (const vector<Real>* v = boost::get<vector<Real>>(&fixings_)) {
        QL_REQUIRE(v->size() <= n, "more fixings than observation dates: " << v->size() << " fixings for " << n
                                                                            << " observation dates");
    }

    vector<bool> observed = observedWindows(schedule);
    vector<ResolvedFixing> result;
    vector<Date> missingFromSeries;
    bool overridden = false;
    for (Size i = 0; i < n; ++i) {
        const Date& d = schedule.observationDates[i];
        Real r = overrideFor(i, d);
        if (r != Null<Real>()) {
            result.push_back({d, r, FixingSource::Override});
            overridden = true;
            continue;
        }
        if (!observed[i]) {
            result.push_back({d, Null<Real>(), FixingSource::Unobserved});
            continue;
        }
        if (series && !series->empty() && d <= series->lastDate())
            missingFromSeries.push_back(d);
        r = curve ? curve->forwardRate(d, schedule.observationDates[i + 1], curve->dayCounter()) : Null<Real>();
        result.push_back({d, r, r == Null<Real>() ? FixingSource::Missing : FixingSource::Curve});
    }

    if (!missingFromSeries.empty()) {
        std::ostringstream dates;
        for (Size i = 0; i < missingFromSeries.size(); ++i)
            dates << (i == 0 ? "" : ", ") << io::iso_date(missingFromSeries[i]);
        StructuredPeriodWarningMessage("FloatingPeriod", "Missing historical fixings",
                                       "Fixings are provided in a series but some dates up to the last fixing are "
                                       "missing, the rates for these dates are projected from the curve",
                                       {{"dates", dates.str()}})
            .log();
    }

    if (overridden && floatSpread_ != 0.0 && spreadCompoundMethod_ == SpreadCompoundMethod::IsdaCompounding) {
        std::ostringstream spread;
        spread << floatSpread_;
        StructuredPeriodWarningMessage("FloatingPeriod", "Spread on fixings",
                                       "Fixings are provided together with a float spread compounded by "
                                       "isda_compounding, unless the fixings exclude the spread it is applied twice",
                                       {{"floatSpread", spread.str()}})
            .log();
    }

    return result;
}

vector<ResolvedFixing> FixingResolver::resolveAll(const ObservationSchedule& schedule,
                                                  const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const {
    vector<ResolvedFixing> result = resolve(schedule, curve);
    for (const auto& f : result) {
        if (f.source == FixingSource::Missing) {
            QL_REQUIRE(curve, "rates could not be calculated: no fixing and no curve for observation date "
                                  << io::iso_date(f.date));
            QL_FAIL("RFRs could not be calculated: the curve has no value for observation date "
                    << io::iso_date(f.date));
        }
    }
    return result;
}

} // namespace engine
} // namespace fpe
