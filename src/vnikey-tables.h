/*
 * SPDX-FileCopyrightText: 2012-2018 CSSlayer <wengxt@gmail.com>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#ifndef VNIKEY_TABLES_H
#define VNIKEY_TABLES_H

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace vnikey {

enum class ToneMark { Acute, Grave, HookAbove, Tilde, Dot };

enum class ShapeMark { Circumflex, Horn, Breve, CrossedD };

using ToneMap = std::unordered_map<uint32_t, uint32_t>;

// A letter that a shape trigger may rewrite. The letter matches only if it
// is the last one in the buffer or the letter after it is in followers.
struct DiacriticRule {
    uint32_t base;
    std::unordered_set<uint32_t> followers;
    uint32_t lower;
    uint32_t upper;
};

// Maps plain and shape-marked vowels (both cases) to their toned form.
const ToneMap &toneMap(ToneMark mark);

const std::vector<DiacriticRule> &diacriticRules(ShapeMark mark);

std::optional<ToneMark> toneForTrigger(uint32_t ch);

std::optional<ShapeMark> shapeForTrigger(uint32_t ch);

// Drops the tone mark, keeps circumflex, breve, horn and the crossed d.
uint32_t removeTone(uint32_t ch);

// Reduces a Vietnamese letter to its ASCII base letter.
uint32_t stripAccents(uint32_t ch);

uint32_t toLowerAscii(uint32_t ch);

uint32_t toUpperAscii(uint32_t ch);

// True for upper case Latin letters, including accented Vietnamese ones.
bool isUpperLetter(uint32_t ch);

} // namespace vnikey

#endif // VNIKEY_TABLES_H
