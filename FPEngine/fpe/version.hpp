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

/*! \file fpe/version.hpp
    \brief FPEngine version and the library versions it is built against
*/

#ifndef fpe_version_hpp
#define fpe_version_hpp

// boost::variant fixings and boost::optional report fields are part of the period interface
#include <boost/version.hpp>
#if BOOST_VERSION < 107200
#error FPEngine requires Boost 1.72 or higher
#endif

// curves are shared through QuantLib::ext::shared_ptr, available from QuantLib 1.31
#include <ql/version.hpp>
#if QL_HEX_VERSION < 0x013100f0
#error FPEngine requires QuantLib 1.31 or higher
#endif

#include <sstream>
#include <string>

#define FPE_VERSION_MAJOR 1
#define FPE_VERSION_MINOR 2
#define FPE_VERSION_PATCH 0

//! Version string
#define FPE_VERSION "1.2.0"

//! Version number, major * 10^6 + minor * 10^4 + patch * 10^2
#define FPE_VERSION_NUM (FPE_VERSION_MAJOR * 1000000 + FPE_VERSION_MINOR * 10000 + FPE_VERSION_PATCH * 100)

namespace fpe {
namespace engine {

//! "FPEngine <version> (QuantLib <version>, Boost <major.minor.patch>)"
inline std::string buildInfo() {
    std::ostringstream out;
    out << "FPEngine " << FPE_VERSION << " (QuantLib " << QL_VERSION << ", Boost " << BOOST_VERSION / 100000 << "."
        << BOOST_VERSION / 100 % 1000 << "." << BOOST_VERSION % 100 << ")";
    return out.str();
}

} // namespace engine
} // namespace fpe

#endif
