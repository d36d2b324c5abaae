/*
 * SPDX-FileCopyrightText: 2024 YubiKey KRunner Plugin Contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "configuration_provider.h"

namespace YubiKeyManager {
namespace Shared {

// Out-of-line destructor anchors the vtable of the interface in this
// translation unit, so implementations that also derive from QObject link
// against a single copy.
ConfigurationProvider::~ConfigurationProvider() = default;

} // namespace Shared
} // namespace YubiKeyManager
