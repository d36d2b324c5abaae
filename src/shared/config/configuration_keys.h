/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

namespace YubiKeyManager {
namespace Shared {
namespace ConfigKeys {

/**
 * @brief Configuration key constants
 *
 * IMPORTANT: Do not change these values as they are persisted in user configuration files.
 */

constexpr const char *CONFIG_FILE = "ykdevicerc";
constexpr const char *GENERAL_GROUP = "General";

// Discovery settings
constexpr const char *TRANSPORTS = "Transports";

// Prompt settings
constexpr const char *TOUCH_PROMPT_DELAY = "TouchPromptDelay";

// Mode programming defaults
constexpr const char *CHALLENGE_RESPONSE_TIMEOUT = "ChallengeResponseTimeout";
constexpr const char *AUTO_EJECT_TIMEOUT = "AutoEjectTimeout";

} // namespace ConfigKeys
} // namespace Shared
} // namespace YubiKeyManager
