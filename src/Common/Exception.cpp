#include <Common/Exception.h>

#include <Common/ErrorCodes.h>
#include <Common/logger_useful.h>

#include <cstring>
#include <typeinfo>
#include <cxxabi.h>

#include <boost/core/demangle.hpp>


namespace SSTIO
{

namespace ErrorCodes
{
    extern const int POCO_EXCEPTION;
    extern const int STD_EXCEPTION;
    extern const int UNKNOWN_EXCEPTION;
}

Exception::Exception(const std::string & msg, int code)
    : Poco::Exception(msg, code)
{
}


std::string Exception::getStackTraceString() const
{
    return boost::stacktrace::to_string(trace);
}


std::string errnoToString(int the_errno)
{
    const size_t buf_size = 128;
    char buf[buf_size];
#ifndef _GNU_SOURCE
    int rc = strerror_r(the_errno, buf, buf_size);
    if (rc != 0)
        return fmt::format("errno: {}, strerror: Unknown error", the_errno);
    return fmt::format("errno: {}, strerror: {}", the_errno, buf);
#else
    return fmt::format("errno: {}, strerror: {}", the_errno, strerror_r(the_errno, buf, buf_size));
#endif
}


void throwFromErrno(const std::string & s, int code, int the_errno)
{
    throw ErrnoException(s + ", " + errnoToString(the_errno), code, the_errno);
}

void throwFromErrnoWithPath(const std::string & s, const std::string & path, int code, int the_errno)
{
    throw ErrnoException(s + ", " + errnoToString(the_errno), code, the_errno, path);
}


void tryLogCurrentException(const char * log_name, const std::string & start_of_message)
{
    tryLogCurrentException(&Poco::Logger::get(log_name), start_of_message);
}

void tryLogCurrentException(Poco::Logger * logger, const std::string & start_of_message)
{
    try
    {
        std::string message = getCurrentExceptionMessage(true);
        if (!start_of_message.empty())
            message = fmt::format("{}: {}", start_of_message, message);
        LOG_ERROR(logger, message);
    }
    catch (...) // NOLINT(bugprone-empty-catch)
    {
    }
}


std::string getExceptionMessage(const Exception & e, bool with_stacktrace)
{
    std::string text = fmt::format("Code: {}. {}", e.code(), e.displayText());

    if (with_stacktrace)
        text += fmt::format(" ({}), Stack trace:\n\n{}", ErrorCodes::getName(e.code()), e.getStackTraceString());
    else
        text += fmt::format(" ({})", ErrorCodes::getName(e.code()));

    return text;
}


std::string getCurrentExceptionMessage(bool with_stacktrace)
{
    std::string text;

    try
    {
        throw;
    }
    catch (const Exception & e)
    {
        text = getExceptionMessage(e, with_stacktrace);
    }
    catch (const Poco::Exception & e)
    {
        try
        {
            text = fmt::format("Poco::Exception. Code: {}, e.code() = {}, {}",
                ErrorCodes::POCO_EXCEPTION, e.code(), e.displayText());
        }
        catch (...) {} // NOLINT(bugprone-empty-catch)
    }
    catch (const std::exception & e)
    {
        try
        {
            text = fmt::format("std::exception. Code: {}, type: {}, e.what() = {}",
                ErrorCodes::STD_EXCEPTION, boost::core::demangle(typeid(e).name()), e.what());
        }
        catch (...) {} // NOLINT(bugprone-empty-catch)
    }
    catch (...)
    {
        try
        {
            text = fmt::format("Unknown exception. Code: {}, type: {}",
                ErrorCodes::UNKNOWN_EXCEPTION, boost::core::demangle(abi::__cxa_current_exception_type()->name()));
        }
        catch (...) {} // NOLINT(bugprone-empty-catch)
    }

    return text;
}


int getCurrentExceptionCode()
{
    try
    {
        throw;
    }
    catch (const Exception & e)
    {
        return e.code();
    }
    catch (const Poco::Exception &)
    {
        return ErrorCodes::POCO_EXCEPTION;
    }
    catch (const std::exception &)
    {
        return ErrorCodes::STD_EXCEPTION;
    }
    catch (...)
    {
        return ErrorCodes::UNKNOWN_EXCEPTION;
    }
}

}
