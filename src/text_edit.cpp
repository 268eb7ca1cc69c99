#include "text_edit.hpp"

static const char* REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

static bool is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

// Length of the well-formed UTF-8 sequence starting at pos, or 0 when the
// bytes there are not one (stray continuation, overlong form, surrogate,
// truncated sequence).
static size_t sequence_length(const std::string& text, size_t pos) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t len;
    unsigned char min_second = 0x80;
    unsigned char max_second = 0xBF;
    if (lead < 0x80) {
        return 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) min_second = 0xA0;
        if (lead == 0xED) max_second = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) min_second = 0x90;
        if (lead == 0xF4) max_second = 0x8F;
    } else {
        return 0;
    }

    if (pos + len > text.size()) return 0;
    unsigned char second = static_cast<unsigned char>(text[pos + 1]);
    if (second < min_second || second > max_second) return 0;
    for (size_t i = pos + 2; i < pos + len; ++i) {
        if (!is_continuation(static_cast<unsigned char>(text[i]))) return 0;
    }
    return len;
}

// An invalid byte counts as one scalar of its own.
static size_t next_boundary(const std::string& text, size_t pos) {
    size_t len = sequence_length(text, pos);
    return pos + (len == 0 ? 1 : len);
}

static unsigned int decode_scalar(const std::string& text, size_t start, size_t end) {
    unsigned char lead = static_cast<unsigned char>(text[start]);
    size_t len = end - start;
    unsigned int value;
    if (len == 1) {
        return lead;
    } else if (len == 2) {
        value = lead & 0x1F;
    } else if (len == 3) {
        value = lead & 0x0F;
    } else {
        value = lead & 0x07;
    }
    for (size_t i = start + 1; i < end; ++i) {
        value = (value << 6) | (static_cast<unsigned char>(text[i]) & 0x3F);
    }
    return value;
}

// C0 controls, DEL and C1 controls.
static bool is_control_scalar(unsigned int value) {
    return value < 0x20 || (value >= 0x7F && value <= 0x9F);
}

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (size_t pos = 0; pos < text.size(); pos = next_boundary(text, pos)) {
        ++count;
    }
    return count;
}

size_t utf8_byte_offset(const std::string& text, size_t char_index) {
    size_t pos = 0;
    for (size_t i = 0; i < char_index && pos < text.size(); ++i) {
        pos = next_boundary(text, pos);
    }
    return pos;
}

std::string utf8_sanitize(const std::string& text) {
    std::string output;
    output.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = sequence_length(text, pos);
        if (len == 0) {
            output += REPLACEMENT_CHARACTER;
            ++pos;
        } else {
            output.append(text, pos, len);
            pos += len;
        }
    }
    return output;
}

TextEdit::TextEdit(const std::string& initial)
    : buffer(utf8_sanitize(initial)), cursor_pos(utf8_length(buffer)) {}

size_t TextEdit::length() const {
    return utf8_length(buffer);
}

bool TextEdit::move_left() {
    if (cursor_pos == 0) return false;
    --cursor_pos;
    return true;
}

bool TextEdit::move_right() {
    if (cursor_pos >= length()) return false;
    ++cursor_pos;
    return true;
}

bool TextEdit::move_home() {
    if (cursor_pos == 0) return false;
    cursor_pos = 0;
    return true;
}

bool TextEdit::move_end() {
    size_t len = length();
    if (cursor_pos == len) return false;
    cursor_pos = len;
    return true;
}

bool TextEdit::backspace() {
    if (cursor_pos == 0) return false;

    size_t start = utf8_byte_offset(buffer, cursor_pos - 1);
    size_t end = utf8_byte_offset(buffer, cursor_pos);
    buffer.erase(start, end - start);
    --cursor_pos;
    return true;
}

bool TextEdit::delete_forward() {
    if (cursor_pos >= length()) return false;

    size_t start = utf8_byte_offset(buffer, cursor_pos);
    size_t end = utf8_byte_offset(buffer, cursor_pos + 1);
    buffer.erase(start, end - start);
    return true;
}

bool TextEdit::insert_text(const std::string& text) {
    std::string clean = utf8_sanitize(text);
    std::string filtered;
    size_t inserted = 0;
    size_t pos = 0;
    while (pos < clean.size()) {
        size_t end = next_boundary(clean, pos);
        if (!is_control_scalar(decode_scalar(clean, pos, end))) {
            filtered.append(clean, pos, end - pos);
            ++inserted;
        }
        pos = end;
    }

    if (filtered.empty()) return false;

    buffer.insert(utf8_byte_offset(buffer, cursor_pos), filtered);
    cursor_pos += inserted;
    return true;
}

std::string TextEdit::render_with_cursor() const {
    std::string output = buffer;
    output.insert(utf8_byte_offset(buffer, cursor_pos), "|");
    return output;
}
