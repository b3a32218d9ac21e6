#pragma once

#ifndef THREAT_SCANNER_PORTS_ERRORS_HPP
#define THREAT_SCANNER_PORTS_ERRORS_HPP

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// Forward declarations
namespace errors
{
class Error;
}
using error = std::shared_ptr<errors::Error>;

namespace errors
{

// --- Core Error Interface ---

/**
 * @class Error
 * @brief The base interface for error types.
 */
class Error
{
public:
    virtual ~Error() = default;
    [[nodiscard]] virtual std::string What() const = 0;

    // Provides access to the next error in a wrapped chain.
    [[nodiscard]] virtual error Unwrap() const
    {
        return nullptr;
    }

    // Provides access to a list of errors for joined errors.
    [[nodiscard]] virtual std::vector<error> GetJoined() const
    {
        return {};
    }
};

/**
 * @brief Failure categories of a scan run.
 */
enum class Kind
{
    UnsupportedFormat,      // unknown input extension, rejected before partitioning
    LoadFailure,            // I/O or structural read error of the whole input
    PartitionParseFailure,  // one partition could not be read as a table
    WorkerFailure,          // a worker rank died, the run is aborted
    WriteFailure,           // the result artifact could not be replaced
    InvalidConfig,
};

// --- Concrete Error Types ---

/**
 * @class StringError
 * @brief A simple error type that holds a text message. Used by New().
 */
class StringError : public Error
{
private:
    std::string message;

public:
    explicit StringError(std::string msg) : message(std::move(msg)) {}
    [[nodiscard]] std::string What() const override
    {
        return this->message;
    }
};

/**
 * @class WrappedError
 * @brief An error type that wraps another error, adding context. Used by Wrap().
 */
class WrappedError : public Error
{
private:
    std::string message;
    error err;

public:
    WrappedError(std::string msg, error e) : message(std::move(msg)), err(std::move(e)) {}
    [[nodiscard]] std::string What() const override
    {
        return this->message + ": " + err->What();
    }
    [[nodiscard]] error Unwrap() const override
    {
        return err;
    }
};

/**
 * @class KindError
 * @brief Tags an error with its Kind so callers can branch on the category
 * without parsing messages. The cause, if any, stays reachable through Unwrap().
 */
class KindError : public Error
{
private:
    Kind kind;
    std::string message;
    error cause;

public:
    KindError(Kind k, std::string msg, error c) : kind(k), message(std::move(msg)), cause(std::move(c)) {}
    [[nodiscard]] Kind GetKind() const
    {
        return kind;
    }
    [[nodiscard]] std::string What() const override
    {
        if (cause) {
            return message + ": " + cause->What();
        }
        return message;
    }
    [[nodiscard]] error Unwrap() const override
    {
        return cause;
    }
};

/**
 * @class JoinedError
 * @brief An error type that combines multiple errors into one. Used by Join().
 */
class JoinedError : public Error
{
private:
    std::vector<error> errs;

public:
    explicit JoinedError(std::vector<error> es) : errs(std::move(es)) {}
    [[nodiscard]] std::string What() const override
    {
        std::stringstream ss;
        for (size_t i = 0; i < errs.size(); ++i) {
            ss << errs[i]->What();
            if (i < errs.size() - 1) {
                ss << "; ";
            }
        }
        return ss.str();
    }
    [[nodiscard]] std::vector<error> GetJoined() const override
    {
        return errs;
    }
};

// --- Public API Functions ---

/**
 * @brief Creates a new error with the given text message.
 */
inline error New(const std::string & message)
{
    return std::make_shared<StringError>(message);
}

/**
 * @brief Creates an error of the given kind, optionally caused by another one.
 */
inline error OfKind(Kind kind, const std::string & message, error cause = nullptr)
{
    return std::make_shared<KindError>(kind, message, std::move(cause));
}

/**
 * @brief Wraps an existing error with a static message.
 *
 * @note If the provided error is nullptr, a new error is created with the
 * given message.
 */
inline error Wrap(error err, const std::string & msg)
{
    if (err == nullptr) {
        return errors::New(msg);
    }
    return std::make_shared<WrappedError>(msg, err);
}

/**
 * @brief Reports whether err, or anything it wraps or joins, carries kind.
 */
inline bool IsKind(error err, Kind kind)
{
    std::vector<error> stack;
    if (err) {
        stack.push_back(err);
    }

    while (!stack.empty()) {
        error current = stack.back();
        stack.pop_back();

        auto tagged = std::dynamic_pointer_cast<KindError>(current);
        if (tagged && tagged->GetKind() == kind) {
            return true;
        }

        auto joined = current->GetJoined();
        if (!joined.empty()) {
            stack.insert(stack.end(), joined.rbegin(), joined.rend());
        }

        if (error next = current->Unwrap()) {
            stack.push_back(next);
        }
    }
    return false;
}

/**
 * @brief Combines a list of errors into a single error. Nullptr errors are
 * filtered out.
 */
inline error Join(const std::vector<error> & list)
{
    std::vector<error> errs;
    for (const auto & e : list) {
        if (e) {
            errs.push_back(e);
        }
    }

    if (errs.empty()) {
        return nullptr;
    }
    if (errs.size() == 1) {
        return errs[0];
    }
    return std::make_shared<JoinedError>(errs);
}

}  // namespace errors

#endif  // THREAT_SCANNER_PORTS_ERRORS_HPP
