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

/*! \file fpe/utilities/log.hpp
    \brief Classes and functions for log message handling.
    \ingroup utilities
*/

#pragma once

// accumulated 'filter' for 'external' DEBUG_MASK
#define FPE_ALERT 1    // 00000001   1 = 2^1-1
#define FPE_CRITICAL 2 // 00000010   2 = 2^2-2
#define FPE_ERROR 4    // 00000100   4
#define FPE_WARNING 8  // 00001000   8
#define FPE_NOTICE 16  // 00010000   16
#define FPE_DEBUG 32   // 00100000   32
#define FPE_DATA 64    // 01000000   64

#include <list>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include <boost/thread/shared_mutex.hpp>
#include <ql/patterns/singleton.hpp>
#include <ql/shared_ptr.hpp>

namespace fpe {
namespace engine {

//! The Base Custom Log Handler class
/*!
  This base log handler class can be used to define your own custom handler and then registered with the Log class.
  Once registered it will receive all log messages as soon as they occur via it's log() method
  \ingroup utilities
  \see Log
 */
class Logger {
public:
    //! Destructor
    virtual ~Logger() {}

    //! The Log call back function
    /*!
      This function will be called every time a log message is produced.
      \param level the log level
      \param s the log message
     */
    virtual void log(unsigned level, const std::string& s) = 0;

    //! Returns the Logger name
    const std::string& name() const { return name_; }

protected:
    //! Constructor
    /*!
      Implementations must provide a logger name
      \param name the logger name
     */
    Logger(const std::string& name) : name_(name) {}

private:
    std::string name_;
};

//! Stderr Logger
/*!
  This logger writes each log message out to stderr.
  \ingroup utilities
  \see Log
 */
class StderrLogger : public Logger {
public:
    //! the name "StderrLogger"
    static const std::string name;
    //! Constructor
    /*!
      This logger writes all logs to stderr.
      If alertOnly is set to true, it will only write alerts.
     */
    StderrLogger(bool alertOnly = false) : Logger(name), alertOnly_(alertOnly) {}
    //! Destructor
    virtual ~StderrLogger() {}
    //! The log callback
    virtual void log(unsigned l, const std::string& s) override;

private:
    bool alertOnly_;
};

//! BufferLogger
/*!
  This logger stores each log message in an internal buffer, its messages can then be read at a later
  point. Log messages are always returned in FIFO order.

  Typical usage to display log messages would be
  <pre>
      while (bLogger.hasNext()) {
          MsgBox("Log Message", bLogger.next());
      }
  </pre>
  \ingroup utilities
  \see Log
 */
class BufferLogger : public Logger {
public:
    //! the name "BufferLogger"
    static const std::string name;
    //! Constructor
    BufferLogger(unsigned minLevel = FPE_DATA) : Logger(name), minLevel_(minLevel) {}
    //! Destructor
    virtual ~BufferLogger() {}
    //! The log callback
    virtual void log(unsigned level, const std::string& s) override;

    //! Checks if Logger has new messages
    /*!
      \return True if this BufferLogger has any new log messages
     */
    bool hasNext();
    //! Retrieve new messages
    /*!
      Retrieve the next new message from the buffer, this will throw if the buffer is empty.
      Messages are returned in FIFO order. Messages are deleted from the buffer once returned.
      \return The next message
     */
    std::string next();
    //! Number of buffered messages
    std::size_t size() const { return buffer_.size(); }
    //! Remove all buffered messages
    void clear() { buffer_.clear(); }

private:
    std::list<std::string> buffer_;
    unsigned minLevel_;
};

//! Global static Log class
/*!
  The Global Log class gets registered with individual loggers and receives application log messages.
  Once a message is received, it is immediately dispatched to each of the registered loggers, the order in which
  the loggers are called is not guaranteed.

  Logging is done by the calling thread and the LOG call blocks until all the loggers have returned.

  At start up, the Log class contains no loggers and so will ignore any received messages.

  Log messages are filtered with a mask, only messages whose level is covered by the mask are dispatched.

  \ingroup utilities
 */
class Log : public QuantLib::Singleton<Log, std::integral_constant<bool, true>> {

    friend class QuantLib::Singleton<Log, std::integral_constant<bool, true>>;

public:
    //! Add a new Logger.
    /*!
      Adds a new logger to the Log class, the logger will be stored by it's name() and will throw if a logger
      with this name is already registered.
      \param logger the logger to add
     */
    void registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger);
    //! Check if logger exists
    bool hasLogger(const std::string& name) const;
    //! Retrieve a Logger.
    /*!
      Retrieve a Logger from the Log class by it's name. This will throw if the logger is not registered.
      \param name the name of the logger
     */
    QuantLib::ext::shared_ptr<Logger>& logger(const std::string& name);
    //! Remove a Logger
    /*!
      Remove a logger by name
      \param name the name of the logger
     */
    void removeLogger(const std::string& name);
    //! Remove all loggers
    /*!
      Removes all loggers. If called, all subsequent log messages will be ignored.
     */
    void removeAllLoggers();

    //! macro utility function - do not use directly
    void header(unsigned m, const char* filename, int lineNo);
    //! macro utility function - do not use directly
    std::ostream& logStream() { return ls_; }
    //! macro utility function - do not use directly
    void log(unsigned m);

    //! mutex to acquire locks
    boost::shared_mutex& mutex() { return mutex_; }

    // Avoid a large number of warnings in VS by adding 0 !=
    bool filter(unsigned mask) {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return 0 != (mask & mask_);
    }
    unsigned mask() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return mask_;
    }
    void setMask(unsigned mask) {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        mask_ = mask;
    }

    bool enabled() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return enabled_;
    }
    void switchOn() {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        enabled_ = true;
    }
    void switchOff() {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        enabled_ = false;
    }

private:
    Log();

    std::map<std::string, QuantLib::ext::shared_ptr<Logger>> loggers_;
    bool enabled_;
    unsigned mask_;
    std::ostringstream ls_;

    mutable boost::shared_mutex mutex_;
};

/*!
  Main Logging macro, do not use this directly, use on of the below 6 macros instead
 */
#define MLOG(mask, text)                                                                                               \
    {                                                                                                                  \
        if (fpe::engine::Log::instance().enabled() && fpe::engine::Log::instance().filter(mask)) {                     \
            std::ostringstream __fpe_oss__;                                                                            \
            __fpe_oss__ << text;                                                                                       \
            boost::unique_lock<boost::shared_mutex> lock(fpe::engine::Log::instance().mutex());                        \
            fpe::engine::Log::instance().header(mask, __FILE__, __LINE__);                                             \
            fpe::engine::Log::instance().logStream() << __fpe_oss__.str();                                             \
            fpe::engine::Log::instance().log(mask);                                                                    \
        }                                                                                                              \
    }

//! Logging Macro (Level = Alert)
#define ALOG(text) MLOG(FPE_ALERT, text);
//! Logging Macro (Level = Critical)
#define CLOG(text) MLOG(FPE_CRITICAL, text);
//! Logging Macro (Level = Error)
#define ELOG(text) MLOG(FPE_ERROR, text);
//! Logging Macro (Level = Warning)
#define WLOG(text) MLOG(FPE_WARNING, text);
//! Logging Macro (Level = Notice)
#define LOG(text) MLOG(FPE_NOTICE, text);
//! Logging Macro (Level = Debug)
#define DLOG(text) MLOG(FPE_DEBUG, text);
//! Logging Macro (Level = Data)
#define TLOG(text) MLOG(FPE_DATA, text);

//! Structured message that can be logged as a warning or error with additional sub fields
/*!
  The message is written as a single line of JSON prefixed with the category, so that loggers downstream can pick
  the structured messages out of the general log stream.
  \ingroup utilities
 */
class StructuredMessage {
public:
    enum class Category { Error, Warning, Unknown };

    enum class Group { Configuration, Curve, Fixing, Period, Unknown };

    StructuredMessage(const Category& category, const Group& group, const std::string& message,
                      const std::map<std::string, std::string>& subFields = std::map<std::string, std::string>());

    virtual ~StructuredMessage() {}

    static constexpr const char* name = "StructuredMessage";

    const Category& category() const { return category_; }
    const Group& group() const { return group_; }
    const std::string& message() const { return message_; }
    const std::map<std::string, std::string>& subFields() const { return subFields_; }

    //! return a JSON formatted string for the message
    std::string json() const;

    //! log the message, warnings are logged at warning level and errors at alert level
    void log() const;

protected:
    void addSubFields(const std::map<std::string, std::string>& subFields);

private:
    Category category_;
    Group group_;
    std::string message_;
    std::map<std::string, std::string> subFields_;
};

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Category&);

std::ostream& operator<<(std::ostream& out, const StructuredMessage::Group&);

} // namespace engine
} // namespace fpe
