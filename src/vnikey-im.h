/*
 * SPDX-FileCopyrightText: 2012-2018 CSSlayer <wengxt@gmail.com>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */
#ifndef _FCITX5_VNIKEY_VNIKEY_IM_H_
#define _FCITX5_VNIKEY_VNIKEY_IM_H_

#include "vnikey-config.h"
#include <fcitx-config/rawconfig.h>
#include <fcitx/addonfactory.h>
#include <fcitx/addoninstance.h>
#include <fcitx/addonmanager.h>
#include <fcitx/inputcontextproperty.h>
#include <fcitx/inputmethodengine.h>
#include <fcitx/instance.h>
#include <string>

namespace vnikey {

class VnikeyState;

class VnikeyEngine final : public fcitx::InputMethodEngineV2 {
public:
    explicit VnikeyEngine(fcitx::Instance *instance);
    ~VnikeyEngine() override;

    fcitx::Instance *instance() { return instance_; }

    void activate(const fcitx::InputMethodEntry &entry,
                  fcitx::InputContextEvent &event) override;
    void deactivate(const fcitx::InputMethodEntry &entry,
                    fcitx::InputContextEvent &event) override;
    void keyEvent(const fcitx::InputMethodEntry &entry,
                  fcitx::KeyEvent &keyEvent) override;
    void reset(const fcitx::InputMethodEntry &entry,
               fcitx::InputContextEvent &event) override;
    void reloadConfig() override;
    void save() override;
    std::string subMode(const fcitx::InputMethodEntry &entry,
                        fcitx::InputContext &inputContext) override;

    const fcitx::Configuration *getConfig() const override {
        return &config_;
    }
    void setConfig(const fcitx::RawConfig &config) override;

    const VnikeyConfig &config() const { return config_; }

private:
    fcitx::Instance *instance_;
    VnikeyConfig config_;
    fcitx::FactoryFor<VnikeyState> factory_;
};

class VnikeyFactory : public fcitx::AddonFactory {
public:
    fcitx::AddonInstance *create(fcitx::AddonManager *manager) override {
        return new VnikeyEngine(manager->instance());
    }
};

} // namespace vnikey

#endif // _FCITX5_VNIKEY_VNIKEY_IM_H_
