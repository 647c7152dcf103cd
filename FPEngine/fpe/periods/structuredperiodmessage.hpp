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

/*! \file fpe/periods/structuredperiodmessage.hpp
    \brief Classes for structured period warnings and configuration errors
    \ingroup periods
*/

#pragma once

#include <fpe/utilities/log.hpp>

namespace fpe {
namespace engine {

//! Structured warning raised while pricing a period, contains the period type and the warning type
class StructuredPeriodWarningMessage : public StructuredMessage {
public:
    StructuredPeriodWarningMessage(const std::string& periodType, const std::string& warningType,
                                   const std::string& warningWhat,
                                   const std::map<std::string, std::string>& subFields = {})
        : StructuredMessage(Category::Warning, Group::Fixing, warningWhat,
                            std::map<std::string, std::string>(
                                {{"warningType", warningType}, {"periodType", periodType}})) {
        addSubFields(subFields);
    }
};

//! Structured configuration error, contains the configuration type (the offending parameter) and the exception type
class StructuredConfigurationErrorMessage : public StructuredMessage {
public:
    StructuredConfigurationErrorMessage(const std::string& configurationType, const std::string& exceptionType,
                                        const std::string& exceptionWhat,
                                        const std::map<std::string, std::string>& subFields = {})
        : StructuredMessage(Category::Error, Group::Configuration, exceptionWhat,
                            std::map<std::string, std::string>(
                                {{"exceptionType", exceptionType}, {"configurationType", configurationType}})) {
        addSubFields(subFields);
    }
};

} // namespace engine
} // namespace fpe
