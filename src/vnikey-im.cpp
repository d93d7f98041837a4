/*
 * SPDX-FileCopyrightText: 2012-2018 CSSlayer <wengxt@gmail.com>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "vnikey-im.h"
#include "vnikey-config.h"
#include "vnikey-log.h"
#include "vnikey-state.h"
#include <fcitx-config/iniparser.h>
#include <fcitx-utils/i18n.h>
#include <fcitx/event.h>
#include <fcitx/inputcontext.h>
#include <fcitx/inputcontextmanager.h>
#include <fcitx/inputmethodentry.h>
#include <string>

namespace vnikey {

namespace {

constexpr char ConfPath[] = "conf/vnikey.conf";

} // namespace

VnikeyEngine::VnikeyEngine(fcitx::Instance *instance)
    : instance_(instance), factory_([this](fcitx::InputContext &ic) {
          return new VnikeyState(this, &ic);
      }) {
    instance_->inputContextManager().registerProperty("vnikey-state",
                                                      &factory_);
    reloadConfig();
}

VnikeyEngine::~VnikeyEngine() {}

void VnikeyEngine::activate(const fcitx::InputMethodEntry & /*entry*/,
                            fcitx::InputContextEvent &event) {
    auto *state = event.inputContext()->propertyFor(&factory_);
    state->reset();
}

void VnikeyEngine::deactivate(const fcitx::InputMethodEntry &entry,
                              fcitx::InputContextEvent &event) {
    reset(entry, event);
}

void VnikeyEngine::keyEvent(const fcitx::InputMethodEntry & /*entry*/,
                            fcitx::KeyEvent &keyEvent) {
    auto *ic = keyEvent.inputContext();
    auto *state = ic->propertyFor(&factory_);
    state->keyEvent(keyEvent);
}

void VnikeyEngine::reset(const fcitx::InputMethodEntry & /*entry*/,
                         fcitx::InputContextEvent &event) {
    auto *state = event.inputContext()->propertyFor(&factory_);
    state->reset();
}

void VnikeyEngine::reloadConfig() {
    fcitx::readAsIni(config_, ConfPath);
    VNIKEY_DEBUG() << "[reloadConfig] KeypadTriggers=" << *config_.keypadTriggers
                   << " UseSurroundingText=" << *config_.useSurroundingText;
}

void VnikeyEngine::setConfig(const fcitx::RawConfig &config) {
    config_.load(config, true);
    fcitx::safeSaveAsIni(config_, ConfPath);
}

void VnikeyEngine::save() {}

std::string VnikeyEngine::subMode(const fcitx::InputMethodEntry & /*entry*/,
                                  fcitx::InputContext & /*inputContext*/) {
    return _("VNI");
}

} // namespace vnikey

FCITX_ADDON_FACTORY_V2(vnikey, vnikey::VnikeyFactory)
