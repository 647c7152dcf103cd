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
#include <fpe/periods/floatingperiod.hpp>
#include <fpe/periods/ratecompounder.hpp>
#include <fpe/periods/structuredperiodmessage.hpp>
#include <fpe/periods/termrateresolver.hpp>
#include <fpe/utilities/log.hpp>

#include <ql/errors.hpp>
#include <ql/io.hpp>
#include <ql/time/calendars/nullcalendar.hpp>
#include <ql/utilities/null.hpp>

#include <sstream>

using namespace QuantLib;
using std::string;
using std::vector;

namespace fpe {
namespace engine {

namespace {
void configurationError(const string& configurationType, const string& what) {
    StructuredConfigurationErrorMessage(configurationType, "Invalid period configuration", what).log();
    QL_FAIL(what);
}
} // namespace

FloatingPeriod::FloatingPeriod(const Date& start, const Date& end, const Date& payment, Frequency frequency,
                               const FloatingPeriodConfig& config, Real notional, const string& currency,
                               const DayCounter& dayCounter, const Date& termination, bool stub)
    : AccrualPeriod(start, end, payment, frequency, notional, currency, dayCounter, termination, stub),
      config_(config) {
    validate();
    DLOG("FloatingPeriod [" << io::iso_date(start_) << ", " << io::iso_date(end_) << "] " << config_.fixingMethod
                            << " " << config_.methodParam << ", " << config_.spreadCompoundMethod << " "
                            << config_.floatSpread << "bp");
}

void FloatingPeriod::validate() const {
    std::ostringstream what;
    switch (config_.fixingMethod) {
    case FixingMethod::RfrPaymentDelay:
    case FixingMethod::RfrLockout:
    case FixingMethod::RfrLookback:
    case FixingMethod::RfrObservationShift:
    case FixingMethod::Ibor:
        break;
    default:
        what << "`fixing_method` must be in {rfr_payment_delay, rfr_lockout, rfr_lookback, rfr_observation_shift, "
                "ibor}, got "
             << config_.fixingMethod;
        configurationError("fixing_method", what.str());
    }

    switch (config_.spreadCompoundMethod) {
    case SpreadCompoundMethod::NoneSimple:
    case SpreadCompoundMethod::IsdaCompounding:
    case SpreadCompoundMethod::IsdaFlatCompounding:
        break;
    default:
        what << "`spread_compound_method` must be in {none_simple, isda_compounding, isda_flat_compounding}, got "
             << config_.spreadCompoundMethod;
        configurationError("spread_compound_method", what.str());
    }

    if (config_.fixingMethod == FixingMethod::RfrLockout && config_.methodParam <= 0)
        configurationError("method_param", "`method_param` must be >0 for \"rfr_lockout\" `fixing_method`");
    if (config_.methodParam < 0) {
        what << "`method_param` must not be negative, got " << config_.methodParam;
        configurationError("method_param", what.str());
    }
    if (config_.fixingMethod == FixingMethod::Ibor && boost::get<vector<Real>>(&config_.fixings))
        configurationError("fixings", "`fixings` can only be a single value for this method");
}

bool FloatingPeriod::isComplex() const {
    return config_.fixingMethod == FixingMethod::RfrLockout || config_.fixingMethod == FixingMethod::RfrLookback ||
           config_.spreadCompoundMethod != SpreadCompoundMethod::NoneSimple;
}

Calendar FloatingPeriod::observationCalendar(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const {
    if (config_.calendar)
        return *config_.calendar;
    if (curve)
        return curve->calendar();
    return NullCalendar();
}

DayCounter FloatingPeriod::observationDayCounter(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const {
    return curve ? curve->dayCounter() : dayCounter_;
}

ObservationSchedule FloatingPeriod::observationSchedule(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const {
    return buildObservationSchedule(config_.fixingMethod, config_.methodParam, start_, end_,
                                    observationCalendar(curve), observationDayCounter(curve));
}

vector<Real> FloatingPeriod::compoundingRates(const ObservationSchedule& schedule, const FixingResolver& resolver,
                                              const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const {
    vector<ResolvedFixing> fixings = resolver.resolveAll(schedule, curve);
    vector<Real> rates(schedule.size());
    for (Size i = 0; i < rates.size(); ++i)
        rates[i] = fixings[schedule.rateIndex[i]].rate;
    return rates;
}

Real FloatingPeriod::rate(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const {
    checkProjectionCurve(curve);

    if (!isRfrMethod(config_.fixingMethod)) {
        TermRateResolver resolver(config_.fixings, config_.methodParam);
        ResolvedFixing f =
            resolver.resolve(start_, end_, frequency_, stub_, dayCounter_, observationCalendar(curve), curve);
        return f.rate + config_.floatSpread / 100.0;
    }

    FixingResolver resolver(config_.fixings, config_.floatSpread, config_.spreadCompoundMethod);
    ObservationSchedule schedule = observationSchedule(curve);
    if (resolver.fixesPeriod()) {
        // resolving reports a spread compounded on top of the fixing
        resolver.resolve(schedule, curve);
        return resolver.periodFixing() + config_.floatSpread / 100.0;
    }

    vector<Real> rates = compoundingRates(schedule, resolver, curve);
    return RateCompounder(config_.spreadCompoundMethod).compound(rates, schedule.accrualDcfs, config_.floatSpread);
}

bool FloatingPeriod::determinedByFixings() const {
    if (boost::get<Real>(&config_.fixings))
        return true;
    if (boost::get<boost::blank>(&config_.fixings))
        return false;
    if (isRfrMethod(config_.fixingMethod))
        return FixingResolver(config_.fixings).determinesRates(observationSchedule(nullptr));
    if (config_.fixingMethod == FixingMethod::Ibor) {
        if (const FixingSeries* s = boost::get<FixingSeries>(&config_.fixings)) {
            TermRateResolver resolver(config_.fixings, config_.methodParam);
            return s->find(resolver.fixingDate(start_, observationCalendar(nullptr))) != Null<Real>();
        }
    }
    return false;
}

boost::optional<Real> FloatingPeriod::cashflow(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const {
    if (!curve && !determinedByFixings())
        return boost::none;
    return -notional_ * dcf_ * rate(curve) / 100.0;
}

ExposureTable FloatingPeriod::fixingsTable(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                                           bool fixingExposure) const {
    checkProjectionCurve(curve);
    ExposureTableBuilder builder(curve, notional_, dcf_, config_.floatSpread, fixingExposure);
    if (!isRfrMethod(config_.fixingMethod)) {
        return builder.build(TermRateResolver(config_.fixings, config_.methodParam), start_, end_, frequency_, stub_,
                             dayCounter_, observationCalendar(curve));
    }
    return builder.build(observationSchedule(curve),
                         FixingResolver(config_.fixings, config_.floatSpread, config_.spreadCompoundMethod),
                         RateCompounder(config_.spreadCompoundMethod), isComplex());
}

Real FloatingPeriod::localAnalyticDelta(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve,
                                        Real discountFactor) const {
    Real bpv = basisPointValue(discountFactor);
    if (!isRfrMethod(config_.fixingMethod) || config_.spreadCompoundMethod == SpreadCompoundMethod::NoneSimple ||
        config_.floatSpread == 0.0)
        return bpv;

    FixingResolver resolver(config_.fixings, config_.floatSpread, config_.spreadCompoundMethod);
    if (resolver.fixesPeriod())
        return bpv;

    checkProjectionCurve(curve);
    ObservationSchedule schedule = observationSchedule(curve);
    vector<Real> rates = compoundingRates(schedule, resolver, curve);
    return bpv * RateCompounder(config_.spreadCompoundMethod)
                     .spreadSensitivity(rates, schedule.accrualDcfs, config_.floatSpread);
}

void FloatingPeriod::addReportData(PeriodCashflowReportData& data,
                                   const QuantLib::ext::shared_ptr<ProjectionCurve>& curve) const {
    AccrualPeriod::addReportData(data, curve);
    data.spread = config_.floatSpread;
    if (curve || determinedByFixings()) {
        data.rate = rate(curve);
        data.amount = -notional_ * dcf_ * *data.rate / 100.0;
    }
}

} // namespace engine
} // namespace fpe
