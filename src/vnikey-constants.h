/*
 * SPDX-FileCopyrightText: 2012-2018 CSSlayer <wengxt@gmail.com>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#ifndef VNIKEY_CONSTANTS_H
#define VNIKEY_CONSTANTS_H

#include <cstdint>

namespace vnikey {

// VNI tone triggers
constexpr uint32_t TRIGGER_ACUTE = '1';
constexpr uint32_t TRIGGER_GRAVE = '2';
constexpr uint32_t TRIGGER_HOOK_ABOVE = '3';
constexpr uint32_t TRIGGER_TILDE = '4';
constexpr uint32_t TRIGGER_DOT = '5';

// VNI shape triggers
constexpr uint32_t TRIGGER_CIRCUMFLEX = '6';
constexpr uint32_t TRIGGER_HORN = '7';
constexpr uint32_t TRIGGER_BREVE = '8';
constexpr uint32_t TRIGGER_CROSSED_D = '9';

// Number of entries in every tone map (12 vowels, both cases)
constexpr auto TONE_MAP_SIZE = 24;

} // namespace vnikey

#endif // VNIKEY_CONSTANTS_H
