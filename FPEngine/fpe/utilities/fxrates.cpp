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

#include <fpe/utilities/fxrates.hpp>
#include <fpe/utilities/log.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <ql/errors.hpp>

using QuantLib::Real;
using std::map;
using std::string;

namespace fpe {
namespace engine {

FxRates::FxRates(const map<string, Real>& rates, const string& base) : base_(boost::to_upper_copy(base)) {
    for (const auto& r : rates) {
        string pair = boost::to_upper_copy(r.first);
        QL_REQUIRE(pair.size() == 6, "FxRates: currency pair '" << r.first << "' must have six letters, e.g. USDNOK");
        QL_REQUIRE(r.second > 0.0, "FxRates: rate for " << pair << " must be positive, got " << r.second);
        rates_[pair] = r.second;
    }
    DLOG("FxRates built with " << rates_.size() << " pairs, base '" << base_ << "'");
}

bool FxRates::find(const string& ccy, const string& target, Real& result) const {
    auto it = rates_.find(ccy + target);
    if (it != rates_.end()) {
        result = it->second;
        return true;
    }
    it = rates_.find(target + ccy);
    if (it != rates_.end()) {
        result = 1.0 / it->second;
        return true;
    }
    return false;
}

Real FxRates::rate(const string& ccy, const string& target) const {
    string c = boost::to_upper_copy(ccy);
    string t = boost::to_upper_copy(target);
    if (c == t)
        return 1.0;

    Real result;
    if (find(c, t, result))
        return result;

    // triangulate through a currency quoted against both
    for (const auto& r : rates_) {
        for (const string& via : {r.first.substr(0, 3), r.first.substr(3)}) {
            Real first, second;
            if (via != c && via != t && find(c, via, first) && find(via, t, second))
                return first * second;
        }
    }
    QL_FAIL("FxRates: no rate available for " << c << t);
}

Real FxRates::conversion(const string& ccy, const string& target) const {
    string t = (target.empty() || target == "_") ? base_ : target;
    QL_REQUIRE(!t.empty(), "FxRates: no target currency given and no base currency set");
    return rate(ccy, t);
}

} // namespace engine
} // namespace fpe
