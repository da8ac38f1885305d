#include "text_buffer.hpp"

namespace arbor {

TextBuffer::TextBuffer(std::string value)
    : value_(std::move(value))
    , cursor_(value_.size())
{
}

void TextBuffer::focus() {
    focused_ = true;
    cursor_ = value_.size();
}

void TextBuffer::blur() {
    focused_ = false;
}

bool TextBuffer::handle_key(const std::string& key) {
    if (!focused_) return false;

    if (key.size() == 1) {
        const unsigned char c = static_cast<unsigned char>(key[0]);
        if (c < 0x20 || c == 0x7f) return false;
        value_.insert(cursor_, 1, key[0]);
        cursor_++;
        return true;
    }

    if (key == "space") {
        value_.insert(cursor_, 1, ' ');
        cursor_++;
        return true;
    }
    if (key == "backspace") {
        if (cursor_ == 0) return false;
        value_.erase(cursor_ - 1, 1);
        cursor_--;
        return true;
    }
    if (key == "delete") {
        if (cursor_ >= value_.size()) return false;
        value_.erase(cursor_, 1);
        return true;
    }
    if (key == "left") {
        if (cursor_ == 0) return false;
        cursor_--;
        return true;
    }
    if (key == "right") {
        if (cursor_ >= value_.size()) return false;
        cursor_++;
        return true;
    }
    if (key == "home") {
        cursor_ = 0;
        return true;
    }
    if (key == "end") {
        cursor_ = value_.size();
        return true;
    }

    // Other named keys (tab, up, ctrl+*) are not text
    return false;
}

void TextBuffer::clear() {
    value_.clear();
    cursor_ = 0;
}

void TextBuffer::set_value(std::string value) {
    value_ = std::move(value);
    cursor_ = value_.size();
}

std::string TextBuffer::render_with_cursor(char marker) const {
    if (!focused_) return value_;
    std::string out = value_;
    out.insert(cursor_, 1, marker);
    return out;
}

} // namespace arbor
