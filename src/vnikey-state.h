/*
 * SPDX-FileCopyrightText: 2012-2018 CSSlayer <wengxt@gmail.com>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */
#ifndef _FCITX5_VNIKEY_VNIKEY_STATE_H_
#define _FCITX5_VNIKEY_VNIKEY_STATE_H_

#include "vnikey-composer.h"
#include <fcitx/event.h>
#include <fcitx/inputcontextproperty.h>
#include <cstddef>

namespace fcitx {
class InputContext;
} // namespace fcitx

namespace vnikey {

class VnikeyEngine;

class VnikeyState final : public fcitx::InputContextProperty {
public:
    VnikeyState(VnikeyEngine *engine, fcitx::InputContext *ic);
    ~VnikeyState() = default;

    void keyEvent(fcitx::KeyEvent &keyEvent);
    void reset();

    const VniComposer &composer() const { return composer_; }

private:
    // Replays backspace/insert steps on the client. Consecutive inserts are
    // committed as one string.
    void applyEdits(const EditSequence &steps);

    // Delete text before the cursor, through surrounding text when the
    // client supports it, otherwise with forwarded BackSpace keys.
    void eraseChars(size_t count);

    VnikeyEngine *engine_;
    fcitx::InputContext *ic_;
    VniComposer composer_;
};

} // namespace vnikey

#endif // _FCITX5_VNIKEY_VNIKEY_STATE_H_
