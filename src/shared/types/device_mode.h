/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QFlags>
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

namespace YubiKeyManager {
namespace Shared {

/**
 * @brief Channel used to talk to the device
 *
 * Values are disjoint powers of two so that transports can be combined
 * into a Transports mask. Each value equals the Capability bit of the
 * same name.
 */
enum class Transport : quint8 {
    NoTransport = 0x00, ///< Reported by a released (null) driver
    OTP = 0x01,         ///< HID keyboard (OTP slots)
    U2F = 0x02,         ///< FIDO U2F HID
    CCID = 0x04         ///< Smart card (ISO 7816 over PC/SC)
};
Q_DECLARE_FLAGS(Transports, Transport)
Q_DECLARE_OPERATORS_FOR_FLAGS(Transports)

/**
 * @brief Sum of all transport flags
 */
constexpr Transports ALL_TRANSPORTS = Transport::OTP | Transport::U2F | Transport::CCID;

/**
 * @brief Discovery priority: smart card first, then OTP, then U2F
 */
const QList<Transport> &transportPriority();

/**
 * @brief Function the hardware supports
 *
 * The three transport capabilities share their bit with Transport.
 */
enum class Capability : quint8 {
    NoCapability = 0x00,
    OTP = 0x01,   ///< Yubico OTP / challenge-response slots
    U2F = 0x02,   ///< FIDO U2F
    CCID = 0x04,  ///< Smart card interface
    OPGP = 0x08,  ///< OpenPGP applet
    PIV = 0x10,   ///< PIV applet
    OATH = 0x20   ///< OATH applet
};
Q_DECLARE_FLAGS(Capabilities, Capability)
Q_DECLARE_OPERATORS_FOR_FLAGS(Capabilities)

/**
 * @brief Capability bits that correspond to transports
 */
constexpr Capabilities TRANSPORT_CAPABILITIES = Capability::OTP | Capability::U2F | Capability::CCID;

[[nodiscard]] Capabilities toCapabilities(Transports transports);
[[nodiscard]] QString transportName(Transport transport);

/**
 * @brief Parses a single transport name ("OTP", "U2F"/"FIDO", "CCID")
 * @return Transport, or std::nullopt for anything else
 */
[[nodiscard]] std::optional<Transport> transportFromName(const QString &name);
[[nodiscard]] QString capabilitiesToString(Capabilities capabilities);

/**
 * @brief Device mode: a numeric code paired with its enabled transports
 *
 * The device accepts seven codes:
 * @code
 * 0 OTP           4 OTP+U2F
 * 1 CCID          5 U2F+CCID
 * 2 OTP+CCID      6 OTP+U2F+CCID
 * 3 U2F
 * @endcode
 *
 * A default-constructed Mode is invalid and has no transports.
 */
class Mode
{
public:
    static constexpr quint8 INVALID_CODE = 0xFF;

    Mode() = default;

    /**
     * @brief Looks up the mode with the given code
     * @return Mode, or std::nullopt for codes outside 0..6
     */
    [[nodiscard]] static std::optional<Mode> fromCode(int code);

    /**
     * @brief Finds the mode enabling exactly the given transports
     * @return Mode, or std::nullopt for an empty mask
     */
    [[nodiscard]] static std::optional<Mode> fromTransports(Transports transports);

    /**
     * @brief Parses "OTP+U2F+CCID" style strings
     *
     * Tokens are case-insensitive, separated by '+', and may appear in any
     * order. "FIDO" is accepted as an alias of U2F.
     */
    [[nodiscard]] static std::optional<Mode> fromString(const QString &text);

    [[nodiscard]] quint8 code() const noexcept { return m_code; }
    [[nodiscard]] Transports transports() const noexcept { return m_transports; }
    [[nodiscard]] bool isValid() const noexcept { return m_code != INVALID_CODE; }
    [[nodiscard]] bool hasTransport(Transport transport) const noexcept;

    /**
     * @brief Formats as "OTP+U2F+CCID" (fixed order), "None" if invalid
     */
    [[nodiscard]] QString toString() const;

    [[nodiscard]] bool operator==(const Mode &other) const noexcept;
    [[nodiscard]] bool operator!=(const Mode &other) const noexcept;

private:
    Mode(quint8 code, Transports transports) noexcept;

    quint8 m_code = INVALID_CODE;
    Transports m_transports;
};

} // namespace Shared
} // namespace YubiKeyManager

Q_DECLARE_METATYPE(YubiKeyManager::Shared::Mode)
