#include <pris/resources.h>

#include <ytrace/ytrace.hpp>

#include <filesystem>

namespace pris {

ResourceMap::ResourceMap(FontProvider::Ptr fonts, ImageLoader::Ptr images,
                         std::vector<std::string> imageSearchPath)
    : _fonts(std::move(fonts)),
      _images(std::move(images)),
      _imageSearchPath(std::move(imageSearchPath)) {}

Result<Font::Ptr> ResourceMap::font(const std::string& family, const std::string& style) {
    if (!_fonts) {
        return std::unexpected(Error::missingFont(family, style));
    }
    return _fonts->find(family, style);
}

Result<VectorImage::Ptr> ResourceMap::image(const std::string& path) {
    if (auto it = _imageCache.find(path); it != _imageCache.end()) {
        return it->second;
    }
    if (!_images) {
        return std::unexpected(Error::missingFile(path));
    }

    std::vector<std::string> candidates;
    if (std::filesystem::path(path).is_relative()) {
        for (const auto& dir : _imageSearchPath) {
            candidates.push_back((std::filesystem::path(dir) / path).string());
        }
    }
    candidates.push_back(path);

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(candidate, ec)) continue;

        ydebug("ResourceMap::image: loading '{}' from '{}'", path, candidate);
        auto res = _images->load(candidate);
        if (!res) return std::unexpected(res.error());
        _imageCache.emplace(path, *res);
        return *res;
    }

    ydebug("ResourceMap::image: '{}' not found in {} location(s)", path, candidates.size());
    return std::unexpected(Error::missingFile(path));
}

} // namespace pris
