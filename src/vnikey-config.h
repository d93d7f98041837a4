/*
 * SPDX-FileCopyrightText: 2012-2018 CSSlayer <wengxt@gmail.com>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */
#ifndef _FCITX5_VNIKEY_VNIKEY_CONFIG_H_
#define _FCITX5_VNIKEY_VNIKEY_CONFIG_H_

#include <fcitx-config/configuration.h>
#include <fcitx-config/option.h>
#include <fcitx-utils/i18n.h>

namespace vnikey {

FCITX_CONFIGURATION(
    VnikeyConfig,
    fcitx::Option<bool> keypadTriggers{
        this, "KeypadTriggers",
        _("Use keypad digits as tone and shape keys"), true};
    fcitx::Option<bool> useSurroundingText{
        this, "UseSurroundingText",
        _("Delete characters through surrounding text when supported"),
        true};);

} // namespace vnikey

#endif // _FCITX5_VNIKEY_VNIKEY_CONFIG_H_
