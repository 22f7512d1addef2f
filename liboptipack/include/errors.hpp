/**
 * @file errors.hpp
 * @brief Exception taxonomy used across the optipack API.
 *
 * Per-file codec failures never surface as exceptions to callers: the
 * transformer records them as ERROR results. The types below cover the
 * failures that do cross the API boundary.
 */

#ifndef OPTIPACK_ERRORS_HPP
#define OPTIPACK_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace optipack {

    /**
     * @brief Root of all optipack exceptions.
     */
    class OptipackError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Bad options or a malformed upload, rejected before a job exists.
     */
    class ValidationError : public OptipackError {
    public:
        using OptipackError::OptipackError;
    };

    /**
     * @brief The archive container cannot be read or written.
     *
     * Thrown by the archive collaborator. At submission time it is
     * rethrown as a ValidationError; inside a job it fails the job.
     */
    class ArchiveError : public OptipackError {
    public:
        using OptipackError::OptipackError;
    };

    /**
     * @brief Unknown, stale or reclaimed job or artifact identifier.
     */
    class NotFoundError : public OptipackError {
    public:
        using OptipackError::OptipackError;
    };

    /**
     * @brief The service is shutting down or its job queue is full.
     */
    class ServiceUnavailableError : public OptipackError {
    public:
        using OptipackError::OptipackError;
    };

} // namespace optipack

#endif // OPTIPACK_ERRORS_HPP
