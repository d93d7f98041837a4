/*
 * SPDX-FileCopyrightText: 2012-2018 CSSlayer <wengxt@gmail.com>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */
#include "vnikey-key.h"
#include <fcitx-utils/keysym.h>

namespace vnikey {

LogicalKey makeCharKey(uint32_t ch, bool capsActive) {
    LogicalKey key;
    key.ch = ch;
    key.capsActive = capsActive;
    return key;
}

LogicalKey toLogicalKey(const fcitx::Key &key, bool isRelease,
                        bool keypadTriggers) {
    using fcitx::KeyState;

    LogicalKey result;
    result.transition =
        isRelease ? KeyTransition::Release : KeyTransition::Press;
    // The keysym already carries Caps Lock and Shift, so capsActive is left
    // unset.

    auto sym = key.sym();
    if (keypadTriggers && sym >= FcitxKey_KP_0 && sym <= FcitxKey_KP_9) {
        sym = static_cast<fcitx::KeySym>(FcitxKey_0 + (sym - FcitxKey_KP_0));
    }

    if (sym == FcitxKey_space || sym == FcitxKey_Tab ||
        sym == FcitxKey_Return || sym == FcitxKey_KP_Enter ||
        sym == FcitxKey_KP_Space || sym == FcitxKey_KP_Tab) {
        result.whitespace = true;
        return result;
    }

    // Shortcuts and cursor movement leave the word being composed.
    if (key.states().testAny(KeyState::Ctrl_Alt) ||
        key.states().test(KeyState::Super)) {
        result.navigation = !key.isModifier();
        return result;
    }

    if (sym == FcitxKey_BackSpace) {
        result.backspace = true;
        return result;
    }

    if (key.isCursorMove() || sym == FcitxKey_Delete ||
        sym == FcitxKey_Escape ||
        (sym >= FcitxKey_Home && sym <= FcitxKey_Insert) ||
        (sym >= FcitxKey_KP_Home && sym <= FcitxKey_KP_Delete)) {
        result.navigation = true;
        return result;
    }

    // Keypad operators, and keypad digits that are not triggers, end the word.
    if (sym >= FcitxKey_KP_Multiply && sym <= FcitxKey_KP_9) {
        result.navigation = true;
        return result;
    }

    if (key.isModifier()) {
        return result;
    }

    auto ch = fcitx::Key::keySymToUnicode(sym);
    if (ch >= 0x20 && ch != 0x7f) {
        result.ch = ch;
    }
    return result;
}

} // namespace vnikey
