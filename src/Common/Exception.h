#pragma once

#include <cerrno>
#include <exception>
#include <optional>
#include <string>
#include <utility>

#include <Poco/Exception.h>

#include <boost/stacktrace.hpp>

#include <fmt/format.h>

namespace Poco { class Logger; }


namespace SSTIO
{

class Exception : public Poco::Exception
{
public:
    Exception(const std::string & msg, int code);

    Exception(int code, const std::string & message)
        : Exception(message, code)
    {}

    // Format message with fmt::format, like the logging functions.
    template <typename ...Args>
    Exception(int code, const std::string & fmt, Args&&... args)
        : Exception(fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...), code)
    {}

    Exception * clone() const override { return new Exception(*this); }
    void rethrow() const override { throw *this; }
    const char * name() const noexcept override { return "SSTIO::Exception"; }
    const char * what() const noexcept override { return message().data(); }

    std::string getStackTraceString() const;

private:
    boost::stacktrace::stacktrace trace;

    const char * className() const noexcept override { return "SSTIO::Exception"; }
};


/// Contains an additional member `saved_errno`. See the throwFromErrno function.
class ErrnoException : public Exception
{
public:
    ErrnoException(const std::string & msg, int code, int saved_errno_, const std::optional<std::string> & path_ = {})
        : Exception(msg, code), saved_errno(saved_errno_), path(path_) {}

    ErrnoException * clone() const override { return new ErrnoException(*this); }
    void rethrow() const override { throw *this; }

    int getErrno() const { return saved_errno; }
    std::optional<std::string> getPath() const { return path; }

private:
    int saved_errno;
    std::optional<std::string> path;

    const char * name() const noexcept override { return "SSTIO::ErrnoException"; }
    const char * className() const noexcept override { return "SSTIO::ErrnoException"; }
};


std::string errnoToString(int the_errno = errno);

[[noreturn]] void throwFromErrno(const std::string & s, int code, int the_errno = errno);
[[noreturn]] void throwFromErrnoWithPath(const std::string & s, const std::string & path, int code,
                                         int the_errno = errno);


/** Try to write an exception to the log (and forget about it).
  * Can be used in destructors in the catch-all block.
  */
void tryLogCurrentException(const char * log_name, const std::string & start_of_message = "");
void tryLogCurrentException(Poco::Logger * logger, const std::string & start_of_message = "");


/** Prints current exception in canonical format.
  * with_stacktrace - prints stack trace for SSTIO::Exception.
  */
std::string getCurrentExceptionMessage(bool with_stacktrace);

/// Returns error code from ErrorCodes
int getCurrentExceptionCode();

std::string getExceptionMessage(const Exception & e, bool with_stacktrace);

}
