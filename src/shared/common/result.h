/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>
#include <utility>

namespace YubiKeyManager {
namespace Shared {

/**
 * @brief Result type for unified error handling
 *
 * Provides a type-safe way to return either a value or an error message.
 * Inspired by Rust's Result<T, E> and similar patterns.
 *
 * @tparam T The type of the successful result value
 *
 * Usage:
 * @code
 * Result<QByteArray> readCapabilities() {
 *     if (!connected()) {
 *         return Result<QByteArray>::error(DeviceErrorCodes::NO_DRIVER);
 *     }
 *     return Result<QByteArray>::success(transmit(command));
 * }
 *
 * // Consuming the result
 * auto result = readCapabilities();
 * if (result.isSuccess()) {
 *     qDebug() << "Capabilities:" << result.value().toHex();
 * } else {
 *     qWarning() << "Error:" << result.error();
 * }
 * @endcode
 *
 * Move-only payloads (std::unique_ptr) are extracted with takeValue().
 */
template<typename T>
class Result {
public:
    /**
     * @brief Creates a successful result with a value
     * @param value The success value
     * @return Result containing the value
     */
    static Result success(T value) {
        return Result(std::move(value), QString());
    }

    /**
     * @brief Creates an error result with an error message
     * @param errorMessage Description of the error
     * @return Result containing the error
     */
    static Result error(const QString &errorMessage) {
        return Result(T(), errorMessage);
    }

    /**
     * @brief Checks if the result represents success
     * @return true if successful, false if error
     */
    bool isSuccess() const {
        return m_error.isEmpty();
    }

    /**
     * @brief Checks if the result represents an error
     * @return true if error, false if successful
     */
    bool isError() const {
        return !m_error.isEmpty();
    }

    /**
     * @brief Gets the success value
     * @return The value
     * @warning Only call if isSuccess() returns true. Behavior undefined otherwise.
     */
    const T &value() const {
        Q_ASSERT(isSuccess());
        return m_value;
    }

    /**
     * @brief Moves the success value out of the result
     * @return The value; the result keeps a moved-from value afterwards
     * @warning Only call if isSuccess() returns true.
     */
    T takeValue() {
        Q_ASSERT(isSuccess());
        return std::move(m_value);
    }

    /**
     * @brief Gets the success value or a default value if error
     * @param defaultValue Value to return if this is an error
     * @return The success value or defaultValue
     */
    T valueOr(const T &defaultValue) const {
        return isSuccess() ? m_value : defaultValue;
    }

    /**
     * @brief Gets the error message
     * @return Error message, or empty string if successful
     */
    QString error() const {
        return m_error;
    }

    /**
     * @brief Explicit conversion to bool (true = success, false = error)
     */
    explicit operator bool() const {
        return isSuccess();
    }

private:
    Result(T value, QString error)
        : m_value(std::move(value))
        , m_error(std::move(error))
    {
    }

    T m_value;
    QString m_error;
};

/**
 * @brief Specialization of Result for void (no value)
 *
 * Used for operations that don't return a value but can fail.
 *
 * Usage:
 * @code
 * Result<void> setMode(const Mode &mode) {
 *     if (!hasMode(mode)) {
 *         return Result<void>::error(DeviceErrorCodes::UNSUPPORTED_MODE);
 *     }
 *     issueCommand(mode);
 *     return Result<void>::success();
 * }
 * @endcode
 */
template<>
class Result<void> {
public:
    static Result success() {
        return Result(QString());
    }

    static Result error(const QString &errorMessage) {
        return Result(errorMessage);
    }

    bool isSuccess() const {
        return m_error.isEmpty();
    }

    bool isError() const {
        return !m_error.isEmpty();
    }

    QString error() const {
        return m_error;
    }

    explicit operator bool() const {
        return isSuccess();
    }

private:
    explicit Result(QString error)
        : m_error(std::move(error))
    {
    }

    QString m_error;
};

} // namespace Shared
} // namespace YubiKeyManager
