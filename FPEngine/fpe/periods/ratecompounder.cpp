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

#include <fpe/periods/ratecompounder.hpp>

#include <ql/errors.hpp>

#include <numeric>

using namespace QuantLib;
using std::vector;

namespace fpe {
namespace engine {

namespace {
Real totalWeight(const vector<Real>& rates, const vector<Real>& dcfs) {
    QL_REQUIRE(!rates.empty(), "RateCompounder: no rates to compound");
    QL_REQUIRE(rates.size() == dcfs.size(),
               "RateCompounder: " << rates.size() << " rates but " << dcfs.size() << " day count fractions");
    Real d = std::accumulate(dcfs.begin(), dcfs.end(), 0.0);
    QL_REQUIRE(d > 0.0, "RateCompounder: day count fractions must sum to a positive value, got " << d);
    return d;
}
} // namespace

void RateCompounder::evaluate(const vector<Real>& rates, const vector<Real>& dcfs, Real spread,
                              const vector<Real>* rateSeed, Real spreadSeed, Real& value, Real& tangent) const {
    Real total = totalWeight(rates, dcfs);
    if (rateSeed) {
        QL_REQUIRE(rateSeed->size() == rates.size(),
                   "RateCompounder: " << rateSeed->size() << " seeds for " << rates.size() << " rates");
    }
    Real s = spread / 100.0;

    switch (method_) {
    case SpreadCompoundMethod::NoneSimple:
    case SpreadCompoundMethod::IsdaCompounding: {
        bool inside = method_ == SpreadCompoundMethod::IsdaCompounding;
        Real p = 1.0, dp = 0.0;
        for (Size i = 0; i < rates.size(); ++i) {
            Real dr = (rateSeed ? (*rateSeed)[i] : 0.0) + (inside ? spreadSeed : 0.0);
            Real f = 1.0 + (rates[i] + (inside ? s : 0.0)) * dcfs[i] / 100.0;
            dp = dp * f + p * dr * dcfs[i] / 100.0;
            p *= f;
        }
        value = (p - 1.0) / total * 100.0 + (inside ? 0.0 : s);
        tangent = dp / total * 100.0 + (inside ? 0.0 : spreadSeed);
        break;
    }
    case SpreadCompoundMethod::IsdaFlatCompounding: {
        Real sum = 0.0, dsum = 0.0, c = 0.0, dc = 0.0;
        for (Size i = 0; i < rates.size(); ++i) {
            Real dr = rateSeed ? (*rateSeed)[i] : 0.0;
            Real cNext = (rates[i] + s) * dcfs[i] / 100.0 + c * rates[i] * dcfs[i] / 100.0;
            Real dcNext = (dr + spreadSeed) * dcfs[i] / 100.0 + (dc * rates[i] + c * dr) * dcfs[i] / 100.0;
            c = cNext;
            dc = dcNext;
            sum += c;
            dsum += dc;
        }
        value = sum / total * 100.0;
        tangent = dsum / total * 100.0;
        break;
    }
    default:
        QL_FAIL("`spread_compound_method` must be in {none_simple, isda_compounding, isda_flat_compounding}, got "
                << method_);
    }
}

Real RateCompounder::compound(const vector<Real>& rates, const vector<Real>& dcfs, Real spread) const {
    Real value, tangent;
    evaluate(rates, dcfs, spread, nullptr, 0.0, value, tangent);
    return value;
}

Real RateCompounder::sensitivity(const vector<Real>& rates, const vector<Real>& dcfs, Real spread,
                                 const vector<Real>& rateSeed, Real spreadSeed) const {
    Real value, tangent;
    evaluate(rates, dcfs, spread, &rateSeed, spreadSeed, value, tangent);
    return tangent;
}

Real RateCompounder::spreadSensitivity(const vector<Real>& rates, const vector<Real>& dcfs, Real spread) const {
    Real value, tangent;
    evaluate(rates, dcfs, spread, nullptr, 1.0, value, tangent);
    return tangent;
}

vector<Real> RateCompounder::simpleSensitivities(const vector<Real>& rates, const vector<Real>& dcfs) const {
    Real total = totalWeight(rates, dcfs);
    vector<Real> result(rates.size());
    for (Size i = 0; i < rates.size(); ++i) {
        Real p = 1.0;
        for (Size j = 0; j < rates.size(); ++j) {
            if (j != i)
                p *= 1.0 + rates[j] * dcfs[j] / 100.0;
        }
        result[i] = p * dcfs[i] / total;
    }
    return result;
}

} // namespace engine
} // namespace fpe
