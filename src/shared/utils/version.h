/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>
#include <QMetaType>

namespace YubiKeyManager {
namespace Shared {

/**
 * @brief Firmware version triple (major.minor.patch)
 *
 * Device generations and firmware quirks are keyed on comparisons
 * against this type, e.g. version >= Version(4, 1, 0).
 */
class Version
{
public:
    /**
     * @brief Constructs a Version object
     * @param major Major version number
     * @param minor Minor version number
     * @param patch Patch version number
     */
    explicit Version(int major = 0, int minor = 0, int patch = 0) noexcept;

    [[nodiscard]] int major() const noexcept { return m_major; }
    [[nodiscard]] int minor() const noexcept { return m_minor; }
    [[nodiscard]] int patch() const noexcept { return m_patch; }

    /**
     * @brief Converts version to string format "major.minor.patch"
     */
    [[nodiscard]] QString toString() const;

    /**
     * @brief Parses version from string format "major.minor.patch"
     * @param versionString String in format "X.Y.Z"
     * @return Parsed Version object, or Version() if parsing fails
     */
    [[nodiscard]] static Version fromString(const QString &versionString);

    /**
     * @brief Builds a version from the first three bytes of a device response
     * @param bytes Raw bytes (major, minor, patch)
     * @return Parsed Version, or Version() if fewer than three bytes are given
     */
    [[nodiscard]] static Version fromBytes(const QByteArray &bytes);

    /**
     * @brief Checks if this version is valid (not 0.0.0)
     */
    [[nodiscard]] bool isValid() const noexcept;

    // Comparison operators
    [[nodiscard]] bool operator==(const Version& other) const noexcept;
    [[nodiscard]] bool operator!=(const Version& other) const noexcept;
    [[nodiscard]] bool operator<(const Version& other) const noexcept;
    [[nodiscard]] bool operator<=(const Version& other) const noexcept;
    [[nodiscard]] bool operator>(const Version& other) const noexcept;
    [[nodiscard]] bool operator>=(const Version& other) const noexcept;

private:
    int m_major;
    int m_minor;
    int m_patch;
};

} // namespace Shared
} // namespace YubiKeyManager

Q_DECLARE_METATYPE(YubiKeyManager::Shared::Version)
