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

/*! \file fpe/curves/curvecheck.hpp
    \brief Checks that a curve offers the capability an operation needs
    \ingroup curves
*/

#pragma once

#include <fpe/curves/discountfactorcurve.hpp>
#include <fpe/curves/ratecurve.hpp>

namespace fpe {
namespace engine {

//! Throws unless \p curve is a DiscountFactorCurve or a RateCurve, a null curve passes
void checkProjectionCurve(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve);

//! Returns \p curve as a DiscountFactorCurve, throws if it is null or of another type
QuantLib::ext::shared_ptr<DiscountFactorCurve>
discountFactorCurve(const QuantLib::ext::shared_ptr<ProjectionCurve>& curve);

} // namespace engine
} // namespace fpe
