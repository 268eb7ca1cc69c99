#pragma once
#include <cstddef>
#include <string>

// Single-line edit buffer for inline renames. The cursor counts Unicode
// scalar values, never bytes, so multi-byte UTF-8 input moves as one unit.
// Malformed UTF-8 in the initial text or in inserted text becomes U+FFFD.
class TextEdit {
public:
    TextEdit() = default;
    explicit TextEdit(const std::string& initial);

    const std::string& text() const { return buffer; }
    size_t cursor() const { return cursor_pos; }
    size_t length() const;

    bool move_left();
    bool move_right();
    bool move_home();
    bool move_end();
    bool backspace();
    bool delete_forward();
    // Control characters are dropped; returns false when nothing is left to insert.
    bool insert_text(const std::string& text);

    // The text with a '|' drawn at the cursor position.
    std::string render_with_cursor() const;

    bool operator==(const TextEdit& other) const {
        return buffer == other.buffer && cursor_pos == other.cursor_pos;
    }
    bool operator!=(const TextEdit& other) const { return !(*this == other); }

private:
    std::string buffer;
    size_t cursor_pos = 0;
};

size_t utf8_length(const std::string& text);
size_t utf8_byte_offset(const std::string& text, size_t char_index);
// Replaces every byte that does not start a well-formed sequence with U+FFFD.
std::string utf8_sanitize(const std::string& text);
