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

#include <fpe/periods/exposuretable.hpp>
#include <fpe/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/io.hpp>

using namespace QuantLib;
using std::vector;

namespace fpe {
namespace engine {

ExposureTableBuilder::ExposureTableBuilder(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve, Real notional,
                                           Real periodDcf, Real floatSpread, bool fixingExposure)
    : curve_(curve), notional_(notional), periodDcf_(periodDcf), floatSpread_(floatSpread),
      fixingExposure_(fixingExposure) {}

void ExposureTableBuilder::appendAggregate(ExposureTable& table, const Date& d, Real rate) const {
    if (fixingExposure_)
        table.push_back({d, -notional_ * periodDcf_ * rate / 100.0, boost::none, rate});
}

ExposureTable ExposureTableBuilder::build(const ObservationSchedule& schedule, const FixingResolver& resolver,
                                          const RateCompounder& compounder, bool complex) const {
    DerivativeOrderGuard guard(curve_, 0);

    vector<ResolvedFixing> fixings = resolver.resolveAll(schedule, curve_);
    Size n = schedule.size();
    ExposureTable table;

    // a single fixing is the rate of the whole period, no observation date carries risk
    if (resolver.fixesPeriod()) {
        Real fixing = resolver.periodFixing();
        for (Size k = 0; k < n; ++k)
            table.push_back({fixings[k].date, 0.0, schedule.observationDcfs[k], fixing});
        appendAggregate(table, schedule.observationDates.back(), fixing + floatSpread_ / 100.0);
        return table;
    }

    vector<Real> stepRates(n);
    for (Size i = 0; i < n; ++i)
        stepRates[i] = fixings[schedule.rateIndex[i]].rate;

    vector<Real> simple;
    if (!complex)
        simple = compounder.simpleSensitivities(stepRates, schedule.accrualDcfs);

    for (Size k = 0; k < n; ++k) {
        vector<Real> seed(n, 0.0);
        bool observed = false;
        for (Size i = 0; i < n; ++i) {
            if (schedule.rateIndex[i] == k) {
                seed[i] = 1.0;
                observed = true;
            }
        }
        if (!observed) {
            table.push_back({fixings[k].date, 0.0, schedule.observationDcfs[k], stepRates[k]});
            continue;
        }
        Real dRate = complex ? compounder.sensitivity(stepRates, schedule.accrualDcfs, floatSpread_, seed, 0.0)
                             : simple[k];
        Real exposure = -notional_ * periodDcf_ / schedule.observationDcfs[k] * dRate;
        table.push_back({fixings[k].date, exposure, schedule.observationDcfs[k], fixings[k].rate});
    }

    Real rate = compounder.compound(stepRates, schedule.accrualDcfs, floatSpread_);
    appendAggregate(table, schedule.observationDates.back(), rate);
    TLOG("ExposureTableBuilder: " << table.size() << " rows, period rate " << rate);
    return table;
}

ExposureTable ExposureTableBuilder::build(const TermRateResolver& resolver, const Date& start, const Date& end,
                                          Frequency frequency, bool stub, const DayCounter& dayCounter,
                                          const Calendar& calendar) const {
    DerivativeOrderGuard guard(curve_, 0);

    ResolvedFixing f = resolver.resolve(start, end, frequency, stub, dayCounter, calendar, curve_);
    ExposureTable table;
    table.push_back({f.date, -notional_, boost::none, f.rate});
    appendAggregate(table, end, f.rate + floatSpread_ / 100.0);
    return table;
}

} // namespace engine
} // namespace fpe
