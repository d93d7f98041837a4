/*
 * SPDX-FileCopyrightText: 2012-2018 CSSlayer <wengxt@gmail.com>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */
#include "vnikey-state.h"
#include "vnikey-im.h"
#include "vnikey-key.h"
#include "vnikey-log.h"
#include <fcitx-utils/capabilityflags.h>
#include <fcitx-utils/key.h>
#include <fcitx-utils/keysym.h>
#include <fcitx-utils/utf8.h>
#include <fcitx/inputcontext.h>
#include <fcitx/surroundingtext.h>
#include <string>

namespace vnikey {

// fcitx hands us the trigger key before the client sees it. Filtering it
// means the client never receives the digit, so nothing extra is erased.
VnikeyState::VnikeyState(VnikeyEngine *engine, fcitx::InputContext *ic)
    : engine_(engine), ic_(ic),
      composer_(ComposerOptions{.triggerCommittedByHost = false}) {}

void VnikeyState::keyEvent(fcitx::KeyEvent &keyEvent) {
    const auto key = toLogicalKey(keyEvent.rawKey(), keyEvent.isRelease(),
                                  *engine_->config().keypadTriggers);
    // BackSpace on a selection removes more than the last character.
    if (key.isPress() && key.isBackspace() &&
        ic_->capabilityFlags().test(fcitx::CapabilityFlag::SurroundingText)) {
        ic_->updateSurroundingText();
        if (ic_->surroundingText().isValid() &&
            !ic_->surroundingText().selectedText().empty()) {
            VNIKEY_DEBUG() << "[keyEvent] BackSpace on selection, resetting";
            composer_.reset();
            return;
        }
    }

    const auto steps = composer_.handleKey(key);
    if (steps.empty()) {
        // Let the client insert the key itself.
        return;
    }

    applyEdits(steps);
    keyEvent.filterAndAccept();
}

void VnikeyState::reset() { composer_.reset(); }

void VnikeyState::applyEdits(const EditSequence &steps) {
    std::string pending;
    for (const auto &step : steps) {
        if (step.type == EditType::Insert) {
            pending.append(fcitx::utf8::UCS4ToUTF8(step.ch));
            continue;
        }
        if (!pending.empty()) {
            ic_->commitString(pending);
            pending.clear();
        }
        eraseChars(step.count);
    }
    if (!pending.empty()) {
        VNIKEY_DEBUG() << "[applyEdits] Committing \"" << pending << "\"";
        ic_->commitString(pending);
    }
}

void VnikeyState::eraseChars(size_t count) {
    if (count == 0) {
        return;
    }

    if (*engine_->config().useSurroundingText &&
        ic_->capabilityFlags().test(fcitx::CapabilityFlag::SurroundingText)) {
        VNIKEY_DEBUG() << "[eraseChars] Deleting surrounding text (-" << count
                       << ", " << count << ")";
        ic_->deleteSurroundingText(-static_cast<int>(count),
                                   static_cast<unsigned int>(count));
        return;
    }

    VNIKEY_DEBUG() << "[eraseChars] Forwarding " << count << " BackSpace";
    const fcitx::Key backspace(FcitxKey_BackSpace);
    for (size_t i = 0; i < count; i++) {
        ic_->forwardKey(backspace, false);
        ic_->forwardKey(backspace, true);
    }
}

} // namespace vnikey
