#include <pris/utf8.h>

namespace pris::utf8 {

std::optional<Decoded> decode(std::string_view bytes) {
    if (bytes.empty()) return std::nullopt;

    const auto* ptr = reinterpret_cast<const uint8_t*>(bytes.data());
    uint8_t lead = ptr[0];

    uint32_t cp = 0;
    size_t len = 0;
    uint32_t min = 0;
    if ((lead & 0x80) == 0) {
        return Decoded{lead, 1};
    } else if ((lead & 0xE0) == 0xC0) {
        cp = lead & 0x1F;
        len = 2;
        min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        cp = lead & 0x0F;
        len = 3;
        min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        cp = lead & 0x07;
        len = 4;
        min = 0x10000;
    } else {
        return std::nullopt;
    }

    if (bytes.size() < len) return std::nullopt;

    for (size_t i = 1; i < len; i++) {
        if ((ptr[i] & 0xC0) != 0x80) return std::nullopt;
        cp = (cp << 6) | (ptr[i] & 0x3F);
    }

    if (cp < min) return std::nullopt;
    if (cp > 0x10FFFF) return std::nullopt;
    if (cp >= 0xD800 && cp <= 0xDFFF) return std::nullopt;

    return Decoded{cp, len};
}

} // namespace pris::utf8
