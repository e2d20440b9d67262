#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace pris::utf8 {

struct Decoded {
    uint32_t codepoint;
    size_t length;  // bytes consumed
};

// Decode one code point at the start of `bytes`.
// Returns nullopt for a truncated sequence, a stray continuation byte, an
// overlong encoding, a surrogate or a value past U+10FFFF.
std::optional<Decoded> decode(std::string_view bytes);

// Decode a whole string into code points with their byte offsets.
// Invalid bytes decode as U+FFFD and consume one byte.
template<typename F>
void forEachCodepoint(std::string_view text, F&& fn) {
    size_t offset = 0;
    while (offset < text.size()) {
        auto d = decode(text.substr(offset));
        if (d) {
            fn(d->codepoint, offset);
            offset += d->length;
        } else {
            fn(0xFFFDu, offset);
            offset += 1;
        }
    }
}

} // namespace pris::utf8
