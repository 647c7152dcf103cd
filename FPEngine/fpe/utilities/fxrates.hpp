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

/*! \file fpe/utilities/fxrates.hpp
    \brief Container of spot FX rates used to express period values in a base currency
    \ingroup utilities
*/

#pragma once

#include <ql/types.hpp>

#include <map>
#include <string>

namespace fpe {
namespace engine {

//! Spot FX rates keyed by currency pair
/*! Pairs are given as six letter codes, e.g. "usdnok" with value 10.0 meaning one USD buys ten NOK. The case of the
    codes is irrelevant. Rates are found directly, by inversion or by triangulation through one common currency.
    \ingroup utilities
*/
class FxRates {
public:
    FxRates() {}
    FxRates(const std::map<std::string, QuantLib::Real>& rates, const std::string& base = "");

    //! The price of one unit of \p ccy expressed in \p target
    QuantLib::Real rate(const std::string& ccy, const std::string& target) const;

    //! The default target currency, empty if none was given
    const std::string& base() const { return base_; }

    //! Conversion factor from \p ccy into \p target, or into base() if \p target is empty or "_"
    QuantLib::Real conversion(const std::string& ccy, const std::string& target = "") const;

    const std::map<std::string, QuantLib::Real>& rates() const { return rates_; }

private:
    bool find(const std::string& ccy, const std::string& target, QuantLib::Real& result) const;
    std::map<std::string, QuantLib::Real> rates_;
    std::string base_;
};

} // namespace engine
} // namespace fpe
