#pragma once

#include <pris/base/factory.h>
#include <pris/base/object.h>
#include <pris/result.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pris {

//=============================================================================
// Font - a shapeable font face
//=============================================================================

// One shaped glyph. Offsets and advances are in font units scaled to
// 1000 units per em, so callers multiply by font_size / 1000.
struct ShapedGlyph {
    uint32_t index = 0;
    double xOffset = 0.0;
    double yOffset = 0.0;
    double xAdvance = 0.0;
    double yAdvance = 0.0;
};

class Font : public base::Object {
public:
    using Ptr = std::shared_ptr<Font>;

    ~Font() override = default;
    const char* typeName() const override { return "Font"; }

    virtual const std::string& family() const = 0;
    virtual const std::string& style() const = 0;

    // Shape a single line of UTF-8 text, left to right.
    virtual Result<std::vector<ShapedGlyph>> shape(std::string_view line) = 0;

    virtual uint64_t glyphCount() const = 0;

protected:
    Font() = default;
};

//=============================================================================
// FontProvider - resolves (family, style) to a Font
//=============================================================================
class FontProvider : public base::Object,
                     public base::ObjectFactory<FontProvider> {
public:
    using Ptr = std::shared_ptr<FontProvider>;

    ~FontProvider() override = default;
    const char* typeName() const override { return "FontProvider"; }

    // System provider: fontconfig for resolution, FreeType for loading
    static Result<Ptr> createImpl();

    // MissingFont error when no face matches
    virtual Result<Font::Ptr> find(const std::string& family, const std::string& style) = 0;

protected:
    FontProvider() = default;
};

//=============================================================================
// VectorImage - a decoded vector image with its intrinsic size
//=============================================================================
class VectorImage : public base::Object {
public:
    using Ptr = std::shared_ptr<const VectorImage>;

    ~VectorImage() override = default;
    const char* typeName() const override { return "VectorImage"; }

    virtual const std::string& path() const = 0;
    virtual double width() const = 0;
    virtual double height() const = 0;

protected:
    VectorImage() = default;
};

//=============================================================================
// ImageLoader - decodes vector image files
//=============================================================================
class ImageLoader : public base::Object,
                    public base::ObjectFactory<ImageLoader> {
public:
    using Ptr = std::shared_ptr<ImageLoader>;

    ~ImageLoader() override = default;
    const char* typeName() const override { return "ImageLoader"; }

    // SVG loader backed by ThorVG
    static Result<Ptr> createImpl();

    // MissingFile error when the file cannot be read or decoded
    virtual Result<VectorImage::Ptr> load(const std::string& path) = 0;

protected:
    ImageLoader() = default;
};

//=============================================================================
// ResourceMap - fonts and images available to builtins
//
// Handed to builtins by mutable reference; caches loaded images by the path
// they were requested with.
//=============================================================================
class ResourceMap {
public:
    ResourceMap(FontProvider::Ptr fonts, ImageLoader::Ptr images,
                std::vector<std::string> imageSearchPath = {});

    Result<Font::Ptr> font(const std::string& family, const std::string& style);

    // Relative paths are tried against each search path entry in order, then
    // as given.
    Result<VectorImage::Ptr> image(const std::string& path);

    const std::vector<std::string>& imageSearchPath() const { return _imageSearchPath; }

private:
    FontProvider::Ptr _fonts;
    ImageLoader::Ptr _images;
    std::vector<std::string> _imageSearchPath;
    std::map<std::string, VectorImage::Ptr> _imageCache;
};

} // namespace pris
