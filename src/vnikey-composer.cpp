/*
 * SPDX-FileCopyrightText: 2012-2018 CSSlayer <wengxt@gmail.com>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */
#include "vnikey-composer.h"
#include "vnikey-log.h"
#include "vnikey-tables.h"
#include <fcitx-utils/utf8.h>
#include <unordered_map>
#include <unordered_set>

namespace vnikey {

FCITX_DEFINE_LOG_CATEGORY(vnikey_log, "vnikey");

namespace {

bool isShapedVowel(uint32_t ch) {
    static const std::unordered_set<uint32_t> shaped = {
        U'ê', U'â', U'ô', U'ă', U'ư', U'Ê', U'Â', U'Ô', U'Ă', U'Ư'};
    return shaped.contains(ch);
}

bool pairsWithO(uint32_t ch) {
    static const std::unordered_set<uint32_t> pairs = {'a', 'e', 'o', 'y',
                                                       'A', 'E', 'O', 'Y'};
    return pairs.contains(ch);
}

int vowelRank(uint32_t ch) {
    static const std::unordered_map<uint32_t, int> ranks = {
        {'a', 5}, {'e', 4}, {'i', 3}, {'o', 2}, {'u', 1}, {'y', 0}};
    if (auto search = ranks.find(toLowerAscii(ch)); search != ranks.end()) {
        return search->second;
    }
    return -1;
}

} // namespace

std::string CompositionBuffer::toString() const {
    std::string result;
    for (auto ch : chars_) {
        result.append(fcitx::utf8::UCS4ToUTF8(ch));
    }
    return result;
}

/**
 * Tone placement, in order of precedence:
 * - ơ takes the tone, first occurrence wins.
 * - otherwise the last â, ê, ô, ă or ư.
 * - oa, oe, oo, oy put it on the second vowel.
 * - gi + something puts it on the character after gi.
 * - otherwise the plain vowel ranked highest in a > e > i > o > u > y,
 *   earliest one on ties.
 */
std::optional<std::pair<uint32_t, size_t>>
selectVowel(const CompositionBuffer &buffer) {
    const auto length = buffer.size();
    std::optional<std::pair<uint32_t, size_t>> shaped;
    int bestRank = -1;
    size_t bestIndex = 0;

    for (size_t idx = 0; idx < length; idx++) {
        const auto ch = removeTone(buffer.at(idx));
        if (ch == U'ơ' || ch == U'Ơ') {
            return std::make_pair(ch, idx);
        }
        if (isShapedVowel(ch)) {
            shaped = std::make_pair(ch, idx);
        } else if ((ch == 'o' || ch == 'O') && idx + 1 < length &&
                   pairsWithO(removeTone(buffer.at(idx + 1)))) {
            return std::make_pair(removeTone(buffer.at(idx + 1)), idx + 1);
        } else if (toLowerAscii(stripAccents(ch)) == 'g' && idx + 2 < length) {
            if (toLowerAscii(buffer.at(idx + 1)) == 'i') {
                return std::make_pair(removeTone(buffer.at(idx + 2)), idx + 2);
            }
        } else if (auto rank = vowelRank(ch); rank > bestRank) {
            bestRank = rank;
            bestIndex = idx;
        }
    }

    if (shaped) {
        return shaped;
    }
    if (bestRank >= 0) {
        return std::make_pair(removeTone(buffer.at(bestIndex)), bestIndex);
    }
    return std::nullopt;
}

EditSequence synthesizeEdit(const CompositionBuffer &buffer, size_t index,
                            uint32_t ch, bool eraseTrigger) {
    auto backspaces = buffer.size() - index;
    if (eraseTrigger) {
        backspaces += 1;
    }

    EditSequence steps;
    steps.push_back(EditOperation::backspace(backspaces));
    steps.push_back(EditOperation::insert(ch));
    for (size_t i = index + 1; i < buffer.size(); i++) {
        steps.push_back(EditOperation::insert(buffer.at(i)));
    }
    return steps;
}

VniComposer::VniComposer(ComposerOptions options) : options_(options) {}

void VniComposer::reset() { buffer_.clear(); }

EditSequence VniComposer::handleKey(const LogicalKey &key) {
    EditSequence steps;
    if (!key.isPress()) {
        return steps;
    }

    if (key.isNavigation() || key.isWhitespace()) {
        VNIKEY_DEBUG() << "[handleKey] Word boundary, clearing \""
                       << buffer_.toString() << "\"";
        buffer_.clear();
        return steps;
    }

    if (key.isBackspace()) {
        buffer_.pop();
        VNIKEY_DEBUG() << "[handleKey] BackSpace, buffer: \""
                       << buffer_.toString() << "\"";
        return steps;
    }

    if (key.ch == 0) {
        return steps;
    }

    auto ch = key.capsActive ? toUpperAscii(key.ch) : key.ch;
    steps = handleChar(ch);
    if (steps.empty()) {
        buffer_.append(ch);
    }

    VNIKEY_DEBUG() << "[handleKey] Key " << fcitx::utf8::UCS4ToUTF8(ch)
                   << " produced " << steps.size()
                   << " edit(s), buffer: \"" << buffer_.toString() << "\"";
    return steps;
}

EditSequence VniComposer::handleChar(uint32_t ch) {
    if (auto shape = shapeForTrigger(ch)) {
        return addDiacritic(diacriticRules(*shape));
    }
    if (auto tone = toneForTrigger(ch)) {
        return addAccent(toneMap(*tone));
    }
    return {};
}

/**
 * Adds circumflex, horn, breve or the crossed d.
 *
 * Each rule names a letter and the letters allowed right after it, so
 * "au6" gives "âu" while "aq6" is left alone. A letter at the end of the
 * word always matches. Every matching position is rewritten, e.g. "uon7"
 * gives "ươn".
 */
EditSequence VniComposer::addDiacritic(const std::vector<DiacriticRule> &rules) {
    const auto length = buffer_.size();
    EditSequence steps;
    bool isFirstMatch = true;

    for (size_t i = 0; i < length; i++) {
        const auto ch = buffer_.at(i);
        const auto cleanCh = toLowerAscii(stripAccents(ch));
        const bool isLast = i + 1 == length;
        const auto nextCh =
            isLast ? cleanCh : toLowerAscii(stripAccents(buffer_.at(i + 1)));

        for (const auto &rule : rules) {
            if (rule.base != cleanCh) {
                continue;
            }
            if (!isLast && !rule.followers.contains(nextCh)) {
                continue;
            }
            auto replacement = isUpperLetter(ch) ? rule.upper : rule.lower;
            auto edit = replaceCharAt(i, replacement, isFirstMatch);
            steps.insert(steps.end(), edit.begin(), edit.end());
            isFirstMatch = false;
        }
    }
    return steps;
}

EditSequence VniComposer::addAccent(const ToneMap &map) {
    auto vowel = selectVowel(buffer_);
    if (!vowel) {
        return {};
    }
    auto [ch, index] = *vowel;
    auto search = map.find(ch);
    if (search == map.end()) {
        VNIKEY_DEBUG() << "[addAccent] No tone for "
                       << fcitx::utf8::UCS4ToUTF8(ch) << " at " << index;
        return {};
    }
    return replaceCharAt(index, search->second, true);
}

EditSequence VniComposer::replaceCharAt(size_t index, uint32_t ch,
                                        bool isFirstEdit) {
    auto steps = synthesizeEdit(buffer_, index, ch,
                                isFirstEdit && options_.triggerCommittedByHost);
    buffer_.replace(index, ch);
    return steps;
}

} // namespace vnikey
