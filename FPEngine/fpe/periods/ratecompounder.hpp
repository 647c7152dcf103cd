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

/*! \file fpe/periods/ratecompounder.hpp
    \brief Compounding of overnight rates into a period rate
    \ingroup periods
*/

#pragma once

#include <fpe/periods/types.hpp>

#include <ql/types.hpp>

#include <vector>

namespace fpe {
namespace engine {

//! Compounds a sequence of overnight rates and a float spread into a period rate
/*! Rates and the result are in percent, the spread is in basis points and the day count fractions weight the
    individual rates. With s = spread / 100 and D the sum of the weights:

    - none_simple: (prod(1 + r_i d_i / 100) - 1) / D * 100 + s
    - isda_compounding: (prod(1 + (r_i + s) d_i / 100) - 1) / D * 100
    - isda_flat_compounding: sum(c_i) / D * 100 with c_1 = (r_1 + s) d_1 / 100 and
      c_i = (r_i + s) d_i / 100 + c_{i-1} r_i d_i / 100, i.e. the spread accrues flat and each step's interest
      compounds once at the next rate. Without a spread this is below the none_simple rate for more than two
      rates, since interest on interest earned before the previous step is dropped

    Sensitivities are exact first derivatives. sensitivity() propagates a tangent through the whole compounding
    chain and works for every method; simpleSensitivities() is the closed form of the spread free product.

    \ingroup periods
*/
class RateCompounder {
public:
    explicit RateCompounder(SpreadCompoundMethod method = SpreadCompoundMethod::NoneSimple) : method_(method) {}

    SpreadCompoundMethod method() const { return method_; }
    void setMethod(SpreadCompoundMethod method) { method_ = method; }

    //! The compounded period rate in percent
    QuantLib::Real compound(const std::vector<QuantLib::Real>& rates, const std::vector<QuantLib::Real>& dcfs,
                            QuantLib::Real spread) const;

    //! Directional derivative of compound()
    /*! \param rateSeed the direction of the rates, one entry per rate
        \param spreadSeed the direction of the spread, in percent
    */
    QuantLib::Real sensitivity(const std::vector<QuantLib::Real>& rates, const std::vector<QuantLib::Real>& dcfs,
                               QuantLib::Real spread, const std::vector<QuantLib::Real>& rateSeed,
                               QuantLib::Real spreadSeed) const;

    //! Derivative of compound() with respect to the spread in percent
    QuantLib::Real spreadSensitivity(const std::vector<QuantLib::Real>& rates,
                                     const std::vector<QuantLib::Real>& dcfs, QuantLib::Real spread) const;

    //! Closed form derivatives of the none_simple rate with respect to each rate
    std::vector<QuantLib::Real> simpleSensitivities(const std::vector<QuantLib::Real>& rates,
                                                    const std::vector<QuantLib::Real>& dcfs) const;

private:
    // value and tangent in one pass
    void evaluate(const std::vector<QuantLib::Real>& rates, const std::vector<QuantLib::Real>& dcfs,
                  QuantLib::Real spread, const std::vector<QuantLib::Real>* rateSeed, QuantLib::Real spreadSeed,
                  QuantLib::Real& value, QuantLib::Real& tangent) const;

    SpreadCompoundMethod method_;
};

} // namespace engine
} // namespace fpe
