/*
 * SPDX-FileCopyrightText: 2025
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 * Tests for key handling through the addon:
 * - Plain letters pass through to the application
 * - Shape and tone keys rewrite the word
 * - Word boundaries and backspace
 * - Keypad digit support
 * - Clients without surrounding text
 * - Caps Lock and BackSpace on a selection
 */

#include "testdir.h"
#include "testfrontend_public.h"
#include <fcitx-config/rawconfig.h>
#include <fcitx-utils/capabilityflags.h>
#include <fcitx-utils/eventdispatcher.h>
#include <fcitx-utils/key.h>
#include <fcitx-utils/keysym.h>
#include <fcitx-utils/log.h>
#include <fcitx-utils/macros.h>
#include <fcitx-utils/testing.h>
#include <fcitx/addonmanager.h>
#include <fcitx/inputcontext.h>
#include <fcitx/inputmethodgroup.h>
#include <fcitx/inputmethodmanager.h>
#include <fcitx/instance.h>

using namespace fcitx;

namespace {

void setupInputMethodGroup(Instance *instance) {
    auto defaultGroup = instance->inputMethodManager().currentGroup();
    defaultGroup.inputMethodList().clear();
    defaultGroup.inputMethodList().push_back(InputMethodGroupItem("keyboard-us"));
    defaultGroup.inputMethodList().push_back(InputMethodGroupItem("vnikey"));
    defaultGroup.setDefaultInputMethod("");
    instance->inputMethodManager().setGroup(defaultGroup);
}

void scheduleEvent(EventDispatcher *dispatcher, Instance *instance) {
    dispatcher->schedule([dispatcher, instance]() {
        auto *vnikey = instance->addonManager().addon("vnikey", true);
        FCITX_ASSERT(vnikey);

        setupInputMethodGroup(instance);

        auto *testfrontend = instance->addonManager().addon("testfrontend");
        FCITX_ASSERT(testfrontend);

        auto uuid = testfrontend->call<ITestFrontend::createInputContext>("testapp");
        auto *ic = instance->inputContextManager().findByUUID(uuid);
        FCITX_ASSERT(ic);
        ic->setCapabilityFlags(CapabilityFlag::SurroundingText);

        // Switch to VNI.
        testfrontend->call<ITestFrontend::keyEvent>(uuid, Key("Control+space"), false);

        auto press = [testfrontend, uuid](const char *key) {
            return testfrontend->call<ITestFrontend::keyEvent>(uuid, Key(key),
                                                               false);
        };

        RawConfig config;
        config.setValueByPath("KeypadTriggers", "True");
        config.setValueByPath("UseSurroundingText", "True");
        vnikey->setConfig(config);

        // --- Test: Plain letters are not filtered ---
        {
            FCITX_INFO() << "testkeyhandling: Plain letters pass through";
            ic->reset();
            FCITX_ASSERT(!press("t"));
            FCITX_ASSERT(!press("h"));
            FCITX_ASSERT(!press("q"));
            FCITX_ASSERT(!press("space"));
        }

        // --- Test: Circumflex on a single vowel ---
        {
            FCITX_INFO() << "testkeyhandling: a6 -> â";
            ic->reset();
            FCITX_ASSERT(!press("a"));
            testfrontend->call<ITestFrontend::pushCommitExpectation>("â");
            FCITX_ASSERT(press("6"));
            FCITX_ASSERT(!press("space"));
        }

        // --- Test: Rejected pairing ---
        // q may not follow a, so 6 is an ordinary digit.
        {
            FCITX_INFO() << "testkeyhandling: aq6 is left alone";
            ic->reset();
            FCITX_ASSERT(!press("a"));
            FCITX_ASSERT(!press("q"));
            FCITX_ASSERT(!press("6"));
        }

        // --- Test: Horn on both vowels, then a tone ---
        // thuong + 7: u and o are rewritten, each with the rest of the word.
        {
            FCITX_INFO() << "testkeyhandling: thuong71 -> thướng";
            ic->reset();
            for (const char *key : {"t", "h", "u", "o", "n", "g"}) {
                FCITX_ASSERT(!press(key));
            }
            testfrontend->call<ITestFrontend::pushCommitExpectation>("ưong");
            testfrontend->call<ITestFrontend::pushCommitExpectation>("ơng");
            FCITX_ASSERT(press("7"));

            testfrontend->call<ITestFrontend::pushCommitExpectation>("ớng");
            FCITX_ASSERT(press("1"));
        }

        // --- Test: Tone on oa cluster ---
        {
            FCITX_INFO() << "testkeyhandling: hoa1 -> hoá";
            ic->reset();
            FCITX_ASSERT(!press("h"));
            FCITX_ASSERT(!press("o"));
            FCITX_ASSERT(!press("a"));
            testfrontend->call<ITestFrontend::pushCommitExpectation>("á");
            FCITX_ASSERT(press("1"));
        }

        // --- Test: Upper case letters ---
        {
            FCITX_INFO() << "testkeyhandling: Dang9 -> Đang";
            ic->reset();
            for (const char *key : {"D", "a", "n", "g"}) {
                FCITX_ASSERT(!press(key));
            }
            testfrontend->call<ITestFrontend::pushCommitExpectation>("Đang");
            FCITX_ASSERT(press("9"));
        }

        // --- Test: Space ends the word ---
        {
            FCITX_INFO() << "testkeyhandling: Space clears the composition";
            ic->reset();
            FCITX_ASSERT(!press("a"));
            FCITX_ASSERT(!press("space"));
            FCITX_ASSERT(!press("6"));
        }

        // --- Test: Cursor movement ends the word ---
        {
            FCITX_INFO() << "testkeyhandling: Left clears the composition";
            ic->reset();
            FCITX_ASSERT(!press("o"));
            FCITX_ASSERT(!press("Left"));
            FCITX_ASSERT(!press("7"));
        }

        // --- Test: Backspace removes the last letter ---
        {
            FCITX_INFO() << "testkeyhandling: aq BackSpace 6 -> â";
            ic->reset();
            FCITX_ASSERT(!press("a"));
            FCITX_ASSERT(!press("q"));
            FCITX_ASSERT(!press("BackSpace"));
            testfrontend->call<ITestFrontend::pushCommitExpectation>("â");
            FCITX_ASSERT(press("6"));
        }

        // --- Test: Keypad digits are triggers ---
        {
            FCITX_INFO() << "testkeyhandling: Keypad digit as trigger";
            ic->reset();
            FCITX_ASSERT(!press("o"));
            testfrontend->call<ITestFrontend::pushCommitExpectation>("ô");
            FCITX_ASSERT(press("KP_6"));
        }

        // --- Test: Keypad digits disabled ---
        {
            FCITX_INFO() << "testkeyhandling: Keypad digit with KeypadTriggers off";
            config.setValueByPath("KeypadTriggers", "False");
            vnikey->setConfig(config);

            ic->reset();
            FCITX_ASSERT(!press("o"));
            FCITX_ASSERT(!press("KP_6"));
            // The keypad digit ended the word.
            FCITX_ASSERT(!press("6"));

            config.setValueByPath("KeypadTriggers", "True");
            vnikey->setConfig(config);
        }

        // --- Test: Client without surrounding text ---
        // Characters are erased with forwarded BackSpace keys instead.
        {
            FCITX_INFO() << "testkeyhandling: Forwarded BackSpace without surrounding text";
            ic->setCapabilityFlags(CapabilityFlags{});
            ic->reset();
            FCITX_ASSERT(!press("v"));
            FCITX_ASSERT(!press("i"));
            FCITX_ASSERT(!press("e"));
            FCITX_ASSERT(!press("t"));
            testfrontend->call<ITestFrontend::pushCommitExpectation>("êt");
            FCITX_ASSERT(press("6"));
            testfrontend->call<ITestFrontend::pushCommitExpectation>("ệt");
            FCITX_ASSERT(press("5"));
            ic->setCapabilityFlags(CapabilityFlag::SurroundingText);
        }

        // --- Test: Caps Lock with Shift gives a lower case letter ---
        // The keysym already has the right case; the trigger must keep it.
        {
            FCITX_INFO() << "testkeyhandling: CapsLock+Shift letter keeps its case";
            ic->reset();
            FCITX_ASSERT(!testfrontend->call<ITestFrontend::keyEvent>(
                uuid, Key(FcitxKey_a, KeyStates{KeyState::CapsLock, KeyState::Shift}),
                false));
            testfrontend->call<ITestFrontend::pushCommitExpectation>("â");
            FCITX_ASSERT(press("6"));

            ic->reset();
            FCITX_ASSERT(!testfrontend->call<ITestFrontend::keyEvent>(
                uuid, Key(FcitxKey_A, KeyStates{KeyState::CapsLock}), false));
            testfrontend->call<ITestFrontend::pushCommitExpectation>("Â");
            FCITX_ASSERT(press("6"));
        }

        // --- Test: BackSpace on a selection clears the composition ---
        // The application deletes the whole selection, so the word is gone.
        {
            FCITX_INFO() << "testkeyhandling: BackSpace with selection";
            ic->reset();
            FCITX_ASSERT(!press("a"));
            FCITX_ASSERT(!press("b"));
            ic->surroundingText().setText("ab", 2, 0);
            ic->updateSurroundingText();
            FCITX_ASSERT(!press("BackSpace"));
            ic->surroundingText().setText("", 0, 0);
            ic->updateSurroundingText();
            FCITX_ASSERT(!press("6"));

            // Without a selection BackSpace only drops the last letter.
            ic->reset();
            FCITX_ASSERT(!press("a"));
            FCITX_ASSERT(!press("b"));
            ic->surroundingText().setText("ab", 2, 2);
            ic->updateSurroundingText();
            FCITX_ASSERT(!press("BackSpace"));
            ic->surroundingText().setText("a", 1, 1);
            ic->updateSurroundingText();
            testfrontend->call<ITestFrontend::pushCommitExpectation>("â");
            FCITX_ASSERT(press("6"));
        }

        instance->deactivate();
        dispatcher->schedule([dispatcher, instance]() {
            dispatcher->detach();
            instance->exit();
        });
    });
}

} // namespace

int main() {
    setupTestingEnvironmentPath(TESTING_BINARY_DIR, {"bin"},
                                {TESTING_BINARY_DIR "/test"});

    char arg0[] = "testkeyhandling";
    char arg1[] = "--disable=all";
    char arg2[] = "--enable=testim,testfrontend,vnikey";
    char *argv[] = {arg0, arg1, arg2};

    fcitx::Log::setLogRule("default=3,vnikey=5");

    Instance instance(FCITX_ARRAY_SIZE(argv), argv);
    instance.addonManager().registerDefaultLoader(nullptr);

    EventDispatcher dispatcher;
    dispatcher.attach(&instance.eventLoop());
    scheduleEvent(&dispatcher, &instance);
    instance.exec();

    return 0;
}
