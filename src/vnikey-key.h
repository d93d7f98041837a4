/*
 * SPDX-FileCopyrightText: 2012-2018 CSSlayer <wengxt@gmail.com>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */
#ifndef _FCITX5_VNIKEY_VNIKEY_KEY_H_
#define _FCITX5_VNIKEY_VNIKEY_KEY_H_

#include <fcitx-utils/key.h>
#include <cstdint>

namespace vnikey {

enum class KeyTransition { Press, Release };

// A key event as seen by the composer. ch is 0 for keys that produce no
// character (modifiers, function keys, navigation).
struct LogicalKey {
    uint32_t ch = 0;
    bool capsActive = false;
    KeyTransition transition = KeyTransition::Press;
    bool navigation = false;
    bool whitespace = false;
    bool backspace = false;

    bool isPress() const { return transition == KeyTransition::Press; }
    bool isNavigation() const { return navigation; }
    bool isWhitespace() const { return whitespace; }
    bool isBackspace() const { return backspace; }
};

LogicalKey makeCharKey(uint32_t ch, bool capsActive = false);

// Classifies an fcitx key. Keypad digits are reported as plain digits when
// keypadTriggers is set.
LogicalKey toLogicalKey(const fcitx::Key &key, bool isRelease,
                        bool keypadTriggers);

} // namespace vnikey

#endif // _FCITX5_VNIKEY_VNIKEY_KEY_H_
