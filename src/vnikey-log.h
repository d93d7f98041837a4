/*
 * SPDX-FileCopyrightText: 2012-2018 CSSlayer <wengxt@gmail.com>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#ifndef VNIKEY_LOG_H
#define VNIKEY_LOG_H

#include <fcitx-utils/log.h>

namespace vnikey {

FCITX_DECLARE_LOG_CATEGORY(vnikey_log);

} // namespace vnikey

// Debug log macro for vnikey module
#define VNIKEY_DEBUG() FCITX_LOGC(::vnikey::vnikey_log, Debug)

#endif // VNIKEY_LOG_H
