/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file error.hpp
 * @brief Exception taxonomy shared by every proddb layer.
 *
 * @details
 * Every failure that reaches the command surface is an `Error` carrying a
 * coarse `ErrorKind` (used for exit status and reporting) and a stable,
 * machine-readable `code` (e.g. `DUPLICATE_SERIAL`).
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace proddb::infra {

/**
 * @enum ErrorKind
 * @brief Coarse failure classes.
 */
enum class ErrorKind {
    VALIDATION, ///< Missing or malformed caller input.
    CONFLICT,   ///< Input collides with existing state (duplicates, ambiguous flags).
    NOT_FOUND,  ///< A referenced entity does not exist.
    STORAGE,    ///< SQLite I/O or constraint failure.
    INTERNAL    ///< Environment failure (e.g. entropy source unavailable).
};

/// @brief Returns the upper-case name of a kind ("VALIDATION", "CONFLICT", ...).
const char* to_string(ErrorKind kind);

/**
 * @class Error
 * @brief Base class of all proddb exceptions.
 */
class Error : public std::runtime_error {
  public:
    Error(ErrorKind kind, std::string code, const std::string& message)
        : std::runtime_error(message), kind_(kind), code_(std::move(code))
    {
    }

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& code() const noexcept { return code_; }

  private:
    ErrorKind kind_;
    std::string code_;
};

class ValidationError : public Error {
  public:
    ValidationError(std::string code, const std::string& message)
        : Error(ErrorKind::VALIDATION, std::move(code), message)
    {
    }
};

class ConflictError : public Error {
  public:
    ConflictError(std::string code, const std::string& message)
        : Error(ErrorKind::CONFLICT, std::move(code), message)
    {
    }
};

class NotFoundError : public Error {
  public:
    NotFoundError(std::string code, const std::string& message)
        : Error(ErrorKind::NOT_FOUND, std::move(code), message)
    {
    }
};

/**
 * @class StorageError
 * @brief Wraps a failing SQLite result code.
 */
class StorageError : public Error {
  public:
    StorageError(int sqlite_code, const std::string& message)
        : Error(ErrorKind::STORAGE, "STORAGE", message), sqlite_code_(sqlite_code)
    {
    }

    /// @brief The primary or extended SQLite result code (0 if not from SQLite).
    int sqlite_code() const noexcept { return sqlite_code_; }

  private:
    int sqlite_code_;
};

} // namespace proddb::infra
