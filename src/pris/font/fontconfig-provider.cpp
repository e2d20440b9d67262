#include <pris/resources.h>
#include <pris/utf8.h>

#include <ytrace/ytrace.hpp>

#include <ft2build.h>
#include FT_FREETYPE_H
#include <fontconfig/fontconfig.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace pris {

namespace {

// Glyph metrics are reported at this many units per em
constexpr double UNITS_PER_EM = 1000.0;

// FT_Library is not thread-safe, one per thread. Null when FreeType failed
// to initialize; the error is kept for the font that asks next.
struct FreeTypeLibrary {
    FT_Library lib = nullptr;
    FT_Error initError = 0;
    FreeTypeLibrary() {
        initError = FT_Init_FreeType(&lib);
        if (initError) lib = nullptr;
    }
    ~FreeTypeLibrary() { if (lib) FT_Done_FreeType(lib); }
};

const FreeTypeLibrary& freeTypeLibrary() {
    thread_local FreeTypeLibrary instance;
    return instance;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

struct ResolvedFont {
    std::string path;
    int index = 0;
};

// Resolve family and style to a font file via fontconfig. Fontconfig always
// produces a best match; a match from another family counts as not found.
std::optional<ResolvedFont> resolveFontPath(FcConfig* config,
                                            const std::string& family,
                                            const std::string& style) {
    FcPattern* pattern = FcPatternCreate();
    if (!pattern) return std::nullopt;

    FcPatternAddString(pattern, FC_FAMILY, reinterpret_cast<const FcChar8*>(family.c_str()));
    FcPatternAddString(pattern, FC_STYLE, reinterpret_cast<const FcChar8*>(style.c_str()));

    FcConfigSubstitute(config, pattern, FcMatchPattern);
    FcDefaultSubstitute(pattern);

    FcResult fcResult;
    FcPattern* match = FcFontMatch(config, pattern, &fcResult);
    FcPatternDestroy(pattern);

    std::optional<ResolvedFont> result;
    if (match && fcResult == FcResultMatch) {
        FcChar8* matchedFamily = nullptr;
        FcChar8* fontPath = nullptr;
        int index = 0;
        bool sameFamily =
            FcPatternGetString(match, FC_FAMILY, 0, &matchedFamily) == FcResultMatch &&
            equalsIgnoreCase(reinterpret_cast<const char*>(matchedFamily), family);
        if (sameFamily && FcPatternGetString(match, FC_FILE, 0, &fontPath) == FcResultMatch) {
            FcPatternGetInteger(match, FC_INDEX, 0, &index);
            result = ResolvedFont{reinterpret_cast<const char*>(fontPath), index};
        } else if (matchedFamily) {
            ydebug("resolveFontPath: '{}' resolved to other family '{}'",
                   family, reinterpret_cast<const char*>(matchedFamily));
        }
    }
    if (match) FcPatternDestroy(match);
    return result;
}

} // namespace

//=============================================================================
// FreeTypeFont
//=============================================================================

class FreeTypeFont : public Font {
public:
    FreeTypeFont(std::string family, std::string style, ResolvedFont file)
        : _family(std::move(family)), _style(std::move(style)), _file(std::move(file)) {}

    ~FreeTypeFont() override {
        if (_face) FT_Done_Face(_face);
    }

    Result<void> init() {
        const auto& library = freeTypeLibrary();
        if (!library.lib) {
            return Err("FreeTypeFont: FT_Init_FreeType failed with error " +
                       std::to_string(library.initError));
        }
        FT_Error err = FT_New_Face(library.lib, _file.path.c_str(),
                                   static_cast<FT_Long>(_file.index), &_face);
        if (err) {
            return Err("FreeTypeFont: FreeType error " + std::to_string(err) +
                       " loading " + _file.path);
        }
        if (_face->units_per_EM == 0) {
            return Err("FreeTypeFont: " + _file.path + " is not a scalable font");
        }
        _unitScale = UNITS_PER_EM / static_cast<double>(_face->units_per_EM);
        ydebug("FreeTypeFont: loaded {} ({} glyphs, {} units/em)",
               _file.path, _face->num_glyphs, _face->units_per_EM);
        return Ok();
    }

    const std::string& family() const override { return _family; }
    const std::string& style() const override { return _style; }

    uint64_t glyphCount() const override {
        return _face ? static_cast<uint64_t>(_face->num_glyphs) : 0;
    }

    Result<std::vector<ShapedGlyph>> shape(std::string_view line) override {
        std::vector<ShapedGlyph> glyphs;
        glyphs.reserve(line.size());

        bool hasKerning = FT_HAS_KERNING(_face);
        FT_UInt previous = 0;

        utf8::forEachCodepoint(line, [&](uint32_t cp, size_t) {
            FT_UInt glyphIndex = FT_Get_Char_Index(_face, cp);

            if (hasKerning && previous != 0 && glyphIndex != 0 && !glyphs.empty()) {
                FT_Vector delta;
                if (FT_Get_Kerning(_face, previous, glyphIndex,
                                   FT_KERNING_UNSCALED, &delta) == 0) {
                    glyphs.back().xAdvance += delta.x * _unitScale;
                }
            }

            glyphs.push_back(ShapedGlyph{glyphIndex, 0.0, 0.0, advance(glyphIndex), 0.0});
            previous = glyphIndex;
        });

        return glyphs;
    }

private:
    double advance(FT_UInt glyphIndex) {
        auto it = _advanceCache.find(glyphIndex);
        if (it != _advanceCache.end()) return it->second;

        // Unscaled, unhinted: advance.x is in font units
        double value = 0.0;
        if (FT_Load_Glyph(_face, glyphIndex, FT_LOAD_NO_SCALE | FT_LOAD_NO_BITMAP | FT_LOAD_NO_HINTING) == 0) {
            value = _face->glyph->advance.x * _unitScale;
        } else {
            ywarn("FreeTypeFont: cannot load glyph {} of {}", glyphIndex, _file.path);
            value = UNITS_PER_EM * 0.5;
        }
        _advanceCache[glyphIndex] = value;
        return value;
    }

    std::string _family;
    std::string _style;
    ResolvedFont _file;
    FT_Face _face = nullptr;
    double _unitScale = 1.0;
    std::unordered_map<FT_UInt, double> _advanceCache;
};

//=============================================================================
// FontconfigProvider
//=============================================================================

class FontconfigProvider : public FontProvider {
public:
    ~FontconfigProvider() override {
        if (_config) FcConfigDestroy(_config);
    }

    Result<void> init() {
        _config = FcInitLoadConfigAndFonts();
        if (!_config) {
            return Err("FontconfigProvider: FcInitLoadConfigAndFonts failed");
        }
        return Ok();
    }

    Result<Font::Ptr> find(const std::string& family, const std::string& style) override {
        auto key = std::make_pair(family, style);
        if (auto it = _fonts.find(key); it != _fonts.end()) {
            return it->second;
        }

        auto file = resolveFontPath(_config, family, style);
        if (!file) {
            return std::unexpected(Error::missingFont(family, style));
        }
        ydebug("FontconfigProvider: {} {} -> {}:{}", family, style, file->path, file->index);

        auto font = std::make_shared<FreeTypeFont>(family, style, *file);
        if (auto res = font->init(); !res) {
            yerror("FontconfigProvider: {}", error_msg(res));
            return std::unexpected(Error::missingFont(family, style));
        }

        Font::Ptr ptr = std::move(font);
        _fonts.emplace(std::move(key), ptr);
        return ptr;
    }

private:
    FcConfig* _config = nullptr;
    std::map<std::pair<std::string, std::string>, Font::Ptr> _fonts;
};

Result<FontProvider::Ptr> FontProvider::createImpl() {
    auto impl = std::make_shared<FontconfigProvider>();
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to initialize FontProvider", res);
    }
    return Ok(Ptr(std::move(impl)));
}

} // namespace pris
