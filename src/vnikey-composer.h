/*
 * SPDX-FileCopyrightText: 2012-2018 CSSlayer <wengxt@gmail.com>
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */
#ifndef _FCITX5_VNIKEY_VNIKEY_COMPOSER_H_
#define _FCITX5_VNIKEY_VNIKEY_COMPOSER_H_

#include "vnikey-key.h"
#include "vnikey-tables.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vnikey {

enum class EditType { Backspace, Insert };

// Either "delete count characters before the cursor" or "insert ch at the
// cursor".
struct EditOperation {
    EditType type = EditType::Insert;
    size_t count = 0;
    uint32_t ch = 0;

    static EditOperation backspace(size_t count) {
        return {EditType::Backspace, count, 0};
    }
    static EditOperation insert(uint32_t ch) {
        return {EditType::Insert, 0, ch};
    }

    bool operator==(const EditOperation &other) const = default;
};

using EditSequence = std::vector<EditOperation>;

// The word typed since the last reset. Only grows or shrinks at the tail;
// triggers rewrite single positions in place.
class CompositionBuffer {
public:
    void append(uint32_t ch) { chars_.push_back(ch); }
    void pop() {
        if (!chars_.empty()) {
            chars_.pop_back();
        }
    }
    void clear() { chars_.clear(); }
    void replace(size_t index, uint32_t ch) { chars_.at(index) = ch; }

    uint32_t at(size_t index) const { return chars_.at(index); }
    size_t size() const { return chars_.size(); }
    bool empty() const { return chars_.empty(); }
    const std::vector<uint32_t> &chars() const { return chars_; }

    std::string toString() const;

private:
    std::vector<uint32_t> chars_;
};

struct ComposerOptions {
    // The host commits the trigger keystroke to the client before the
    // composer handles it, so the first rewrite of a trigger also erases
    // the trigger character.
    bool triggerCommittedByHost = true;
};

// Picks the vowel that receives a tone mark. Returns the vowel without its
// tone (shape marks kept) and its position in the buffer.
std::optional<std::pair<uint32_t, size_t>>
selectVowel(const CompositionBuffer &buffer);

// Backspace/insert steps that rewrite buffer[index] to ch in a client that
// holds the buffer contents, plus one trailing trigger character when
// eraseTrigger is set. The buffer itself is not modified.
EditSequence synthesizeEdit(const CompositionBuffer &buffer, size_t index,
                            uint32_t ch, bool eraseTrigger);

class VniComposer {
public:
    explicit VniComposer(ComposerOptions options = {});

    EditSequence handleKey(const LogicalKey &key);
    void reset();

    const CompositionBuffer &buffer() const { return buffer_; }
    const ComposerOptions &options() const { return options_; }

private:
    EditSequence handleChar(uint32_t ch);
    EditSequence addDiacritic(const std::vector<DiacriticRule> &rules);
    EditSequence addAccent(const ToneMap &map);
    EditSequence replaceCharAt(size_t index, uint32_t ch, bool isFirstEdit);

    ComposerOptions options_;
    CompositionBuffer buffer_;
};

} // namespace vnikey

#endif // _FCITX5_VNIKEY_VNIKEY_COMPOSER_H_
