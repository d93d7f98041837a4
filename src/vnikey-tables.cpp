/*
 * SPDX-FileCopyrightText: 2012-2018 CSSlayer <wengxt@gmail.com>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "vnikey-tables.h"
#include "vnikey-constants.h"
#include <array>
#include <cstddef>

namespace vnikey {

namespace {

// base, acute, grave, hook above, tilde, dot below
using ToneRow = std::array<uint32_t, 6>;

constexpr std::array<ToneRow, TONE_MAP_SIZE> ToneRows = {{
    {U'a', U'á', U'à', U'ả', U'ã', U'ạ'},
    {U'ă', U'ắ', U'ằ', U'ẳ', U'ẵ', U'ặ'},
    {U'â', U'ấ', U'ầ', U'ẩ', U'ẫ', U'ậ'},
    {U'e', U'é', U'è', U'ẻ', U'ẽ', U'ẹ'},
    {U'ê', U'ế', U'ề', U'ể', U'ễ', U'ệ'},
    {U'i', U'í', U'ì', U'ỉ', U'ĩ', U'ị'},
    {U'o', U'ó', U'ò', U'ỏ', U'õ', U'ọ'},
    {U'ô', U'ố', U'ồ', U'ổ', U'ỗ', U'ộ'},
    {U'ơ', U'ớ', U'ờ', U'ở', U'ỡ', U'ợ'},
    {U'u', U'ú', U'ù', U'ủ', U'ũ', U'ụ'},
    {U'ư', U'ứ', U'ừ', U'ử', U'ữ', U'ự'},
    {U'y', U'ý', U'ỳ', U'ỷ', U'ỹ', U'ỵ'},
    {U'A', U'Á', U'À', U'Ả', U'Ã', U'Ạ'},
    {U'Ă', U'Ắ', U'Ằ', U'Ẳ', U'Ẵ', U'Ặ'},
    {U'Â', U'Ấ', U'Ầ', U'Ẩ', U'Ẫ', U'Ậ'},
    {U'E', U'É', U'È', U'Ẻ', U'Ẽ', U'Ẹ'},
    {U'Ê', U'Ế', U'Ề', U'Ể', U'Ễ', U'Ệ'},
    {U'I', U'Í', U'Ì', U'Ỉ', U'Ĩ', U'Ị'},
    {U'O', U'Ó', U'Ò', U'Ỏ', U'Õ', U'Ọ'},
    {U'Ô', U'Ố', U'Ồ', U'Ổ', U'Ỗ', U'Ộ'},
    {U'Ơ', U'Ớ', U'Ờ', U'Ở', U'Ỡ', U'Ợ'},
    {U'U', U'Ú', U'Ù', U'Ủ', U'Ũ', U'Ụ'},
    {U'Ư', U'Ứ', U'Ừ', U'Ử', U'Ữ', U'Ự'},
    {U'Y', U'Ý', U'Ỳ', U'Ỷ', U'Ỹ', U'Ỵ'},
}};

const std::unordered_map<uint32_t, uint32_t> ShapeBase = {
    {U'ă', U'a'}, {U'â', U'a'}, {U'ê', U'e'}, {U'ô', U'o'},
    {U'ơ', U'o'}, {U'ư', U'u'}, {U'đ', U'd'}, {U'Ă', U'A'},
    {U'Â', U'A'}, {U'Ê', U'E'}, {U'Ô', U'O'}, {U'Ơ', U'O'},
    {U'Ư', U'U'}, {U'Đ', U'D'}};

ToneMap buildToneMap(size_t column) {
    ToneMap result;
    for (const auto &row : ToneRows) {
        result.insert({row[0], row[column]});
    }
    return result;
}

} // namespace

const ToneMap &toneMap(ToneMark mark) {
    static const std::array<ToneMap, 5> maps = {
        buildToneMap(1), buildToneMap(2), buildToneMap(3), buildToneMap(4),
        buildToneMap(5)};
    return maps[static_cast<size_t>(mark)];
}

const std::vector<DiacriticRule> &diacriticRules(ShapeMark mark) {
    static const std::vector<DiacriticRule> circumflex = {
        {U'a', {'u', 'n', 'm', 'p', 't', 'c', 'y'}, U'â', U'Â'},
        {U'e', {'u', 'n', 'm', 'p', 't', 'c', 'y'}, U'ê', U'Ê'},
        {U'o', {'i', 'n', 'm', 'p', 't', 'c', 'y'}, U'ô', U'Ô'},
    };
    static const std::vector<DiacriticRule> horn = {
        {U'u', {'o', 'i', 'n', 'm', 'a', 'p', 't', 'c'}, U'ư', U'Ư'},
        {U'o', {'i', 'n', 'm', 'p', 't', 'c', 'y'}, U'ơ', U'Ơ'},
    };
    static const std::vector<DiacriticRule> breve = {
        {U'a', {'p', 'n', 'm', 't', 'c'}, U'ă', U'Ă'},
    };
    static const std::vector<DiacriticRule> crossedD = {
        {U'd',
         {'a', 'c', 'e', 'i', 'm', 'n', 'o', 'p', 't', 'u', 'y'},
         U'đ',
         U'Đ'},
    };

    switch (mark) {
    case ShapeMark::Circumflex:
        return circumflex;
    case ShapeMark::Horn:
        return horn;
    case ShapeMark::Breve:
        return breve;
    case ShapeMark::CrossedD:
        break;
    }
    return crossedD;
}

std::optional<ToneMark> toneForTrigger(uint32_t ch) {
    switch (ch) {
    case TRIGGER_ACUTE:
        return ToneMark::Acute;
    case TRIGGER_GRAVE:
        return ToneMark::Grave;
    case TRIGGER_HOOK_ABOVE:
        return ToneMark::HookAbove;
    case TRIGGER_TILDE:
        return ToneMark::Tilde;
    case TRIGGER_DOT:
        return ToneMark::Dot;
    default:
        return std::nullopt;
    }
}

std::optional<ShapeMark> shapeForTrigger(uint32_t ch) {
    switch (ch) {
    case TRIGGER_CIRCUMFLEX:
        return ShapeMark::Circumflex;
    case TRIGGER_HORN:
        return ShapeMark::Horn;
    case TRIGGER_BREVE:
        return ShapeMark::Breve;
    case TRIGGER_CROSSED_D:
        return ShapeMark::CrossedD;
    default:
        return std::nullopt;
    }
}

uint32_t removeTone(uint32_t ch) {
    static const std::unordered_map<uint32_t, uint32_t> map = []() {
        std::unordered_map<uint32_t, uint32_t> result;
        for (const auto &row : ToneRows) {
            for (size_t i = 1; i < row.size(); i++) {
                result.insert({row[i], row[0]});
            }
        }
        return result;
    }();

    if (auto search = map.find(ch); search != map.end()) {
        return search->second;
    }
    return ch;
}

uint32_t stripAccents(uint32_t ch) {
    ch = removeTone(ch);
    if (auto search = ShapeBase.find(ch); search != ShapeBase.end()) {
        return search->second;
    }
    return ch;
}

uint32_t toLowerAscii(uint32_t ch) {
    if (ch >= 'A' && ch <= 'Z') {
        return ch - 'A' + 'a';
    }
    return ch;
}

uint32_t toUpperAscii(uint32_t ch) {
    if (ch >= 'a' && ch <= 'z') {
        return ch - 'a' + 'A';
    }
    return ch;
}

bool isUpperLetter(uint32_t ch) {
    auto base = stripAccents(ch);
    return base >= 'A' && base <= 'Z';
}

} // namespace vnikey
