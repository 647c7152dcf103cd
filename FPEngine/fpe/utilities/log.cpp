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

#include <fpe/utilities/log.hpp>

#include <boost/algorithm/string/replace.hpp>
#include <boost/filesystem/path.hpp>
#include <ql/errors.hpp>

#include <iostream>

using namespace boost::filesystem;
using std::map;
using std::ostream;
using std::string;

namespace fpe {
namespace engine {

const string StderrLogger::name = "StderrLogger";
const string BufferLogger::name = "BufferLogger";

void StderrLogger::log(unsigned l, const string& msg) {
    if (!alertOnly_ || l <= FPE_ALERT)
        std::cerr << msg << std::endl;
}

void BufferLogger::log(unsigned l, const string& msg) {
    if (l <= minLevel_)
        buffer_.push_back(msg);
}

bool BufferLogger::hasNext() { return !buffer_.empty(); }

string BufferLogger::next() {
    QL_REQUIRE(!buffer_.empty(), "Log Buffer is empty");
    string msg = buffer_.front();
    buffer_.pop_front();
    return msg;
}

Log::Log() : loggers_(), enabled_(false), mask_(255), ls_() {
    ls_.setf(std::ios::fixed, std::ios::floatfield);
    ls_.setf(std::ios::showpoint);
}

void Log::registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    QL_REQUIRE(loggers_.find(logger->name()) == loggers_.end(),
               "Logger with name " << logger->name() << " already registered");
    loggers_[logger->name()] = logger;
}

bool Log::hasLogger(const string& name) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return loggers_.find(name) != loggers_.end();
}

QuantLib::ext::shared_ptr<Logger>& Log::logger(const string& name) {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    QL_REQUIRE(loggers_.find(name) != loggers_.end(), "No logger found with name " << name);
    return loggers_[name];
}

void Log::removeLogger(const string& name) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    map<string, QuantLib::ext::shared_ptr<Logger>>::iterator it = loggers_.find(name);
    if (it != loggers_.end()) {
        loggers_.erase(it);
    } else {
        QL_FAIL("No logger found with name " << name);
    }
}

void Log::removeAllLoggers() {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    loggers_.clear();
}

void Log::header(unsigned m, const char* filename, int lineNo) {
    // 1. Reset stringstream
    ls_.str(string());
    ls_.clear();

    // 2. Write the level
    switch (m) {
    case FPE_ALERT:
        ls_ << "ALERT    ";
        break;
    case FPE_CRITICAL:
        ls_ << "CRITICAL ";
        break;
    case FPE_ERROR:
        ls_ << "ERROR    ";
        break;
    case FPE_WARNING:
        ls_ << "WARNING  ";
        break;
    case FPE_NOTICE:
        ls_ << "NOTICE   ";
        break;
    case FPE_DEBUG:
        ls_ << "DEBUG    ";
        break;
    case FPE_DATA:
        ls_ << "DATA     ";
        break;
    }

    // 3. source file and line number, the path is stripped down to the file name
    ls_ << '[' << path(filename).filename().string() << ':' << lineNo << "] : ";
}

void Log::log(unsigned m) {
    string msg = ls_.str();
    for (auto& l : loggers_)
        l.second->log(m, msg);
}

StructuredMessage::StructuredMessage(const Category& category, const Group& group, const string& message,
                                     const map<string, string>& subFields)
    : category_(category), group_(group), message_(message) {
    addSubFields(subFields);
}

void StructuredMessage::addSubFields(const map<string, string>& subFields) {
    for (const auto& sf : subFields) {
        if (!sf.second.empty())
            subFields_[sf.first] = sf.second;
    }
}

namespace {
string jsonEscape(const string& s) {
    string result = boost::replace_all_copy(s, "\\", "\\\\");
    boost::replace_all(result, "\"", "\\\"");
    boost::replace_all(result, "\n", "\\n");
    return result;
}
} // namespace

string StructuredMessage::json() const {
    std::ostringstream out;
    out << "{ \"category\":\"" << category_ << "\", \"group\":\"" << group_ << "\", \"message\":\""
        << jsonEscape(message_) << "\"";
    if (!subFields_.empty()) {
        out << ", \"sub_fields\": [ ";
        bool first = true;
        for (const auto& sf : subFields_) {
            if (!first)
                out << ", ";
            out << "{ \"name\": \"" << jsonEscape(sf.first) << "\", \"value\": \"" << jsonEscape(sf.second) << "\" }";
            first = false;
        }
        out << " ]";
    }
    out << " }";
    return out.str();
}

void StructuredMessage::log() const {
    switch (category_) {
    case Category::Error:
        ALOG("Structured" << category_ << "Message " << json());
        break;
    case Category::Warning:
        WLOG("Structured" << category_ << "Message " << json());
        break;
    case Category::Unknown:
        LOG("Structured" << category_ << "Message " << json());
        break;
    }
}

ostream& operator<<(ostream& out, const StructuredMessage::Category& category) {
    switch (category) {
    case StructuredMessage::Category::Error:
        return out << "Error";
    case StructuredMessage::Category::Warning:
        return out << "Warning";
    default:
        return out << "UnknownType";
    }
}

ostream& operator<<(ostream& out, const StructuredMessage::Group& group) {
    switch (group) {
    case StructuredMessage::Group::Configuration:
        return out << "Configuration";
    case StructuredMessage::Group::Curve:
        return out << "Curve";
    case StructuredMessage::Group::Fixing:
        return out << "Fixing";
    case StructuredMessage::Group::Period:
        return out << "Period";
    default:
        return out << "UnknownType";
    }
}

} // namespace engine
} // namespace fpe
