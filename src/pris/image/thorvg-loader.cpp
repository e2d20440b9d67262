#include <pris/resources.h>

#include <ytrace/ytrace.hpp>
#include <thorvg.h>

#include <memory>

namespace pris {

//=============================================================================
// ThorVG engine reference counting - shared by all loaders
//=============================================================================

static int s_thorvgRefCount = 0;

static Result<void> thorvgEngineRef() {
    if (s_thorvgRefCount == 0) {
        auto result = tvg::Initializer::init(0);
        if (result != tvg::Result::Success) {
            return Err<void>("ThorVG: tvg::Initializer::init failed");
        }
        uint32_t major, minor, micro;
        const char* version = tvg::Initializer::version(&major, &minor, &micro);
        ydebug("ThorVG engine initialized: {}", version ? version : "unknown");
    }
    ++s_thorvgRefCount;
    return Ok();
}

static void thorvgEngineUnref() {
    if (--s_thorvgRefCount == 0) {
        tvg::Initializer::term();
        ydebug("ThorVG engine terminated");
    }
}

//=============================================================================
// SvgImage - holds its own engine reference, images outlive their loader
//=============================================================================

class SvgImage : public VectorImage {
public:
    // Caller has already taken an engine reference on behalf of the image
    SvgImage(std::string path, std::unique_ptr<tvg::Animation> animation, double width, double height)
        : _path(std::move(path)), _animation(std::move(animation)),
          _width(width), _height(height) {}

    ~SvgImage() override {
        // Release ThorVG objects before engine shutdown
        _animation.reset();
        thorvgEngineUnref();
    }

    const std::string& path() const override { return _path; }
    double width() const override { return _width; }
    double height() const override { return _height; }

private:
    std::string _path;
    // Owns the picture; Picture has a protected destructor
    std::unique_ptr<tvg::Animation> _animation;
    double _width;
    double _height;
};

//=============================================================================
// ThorvgLoader
//=============================================================================

class ThorvgLoader : public ImageLoader {
public:
    ~ThorvgLoader() override {
        if (_engineRef) thorvgEngineUnref();
    }

    Result<void> init() {
        if (auto res = thorvgEngineRef(); !res) {
            return Err<void>("ThorvgLoader: engine unavailable", res);
        }
        _engineRef = true;
        return Ok();
    }

    Result<VectorImage::Ptr> load(const std::string& path) override {
        std::unique_ptr<tvg::Animation> animation(tvg::Animation::gen());
        if (!animation) {
            return Err<VectorImage::Ptr>("ThorvgLoader: failed to create Animation");
        }

        tvg::Picture* picture = animation->picture();
        if (!picture) {
            return Err<VectorImage::Ptr>("ThorvgLoader: failed to get picture from Animation");
        }

        auto result = picture->load(path.c_str());
        if (result != tvg::Result::Success) {
            ydebug("ThorvgLoader: load '{}' failed (result={})", path, static_cast<int>(result));
            return std::unexpected(Error::missingFile(path));
        }

        float w = 0, h = 0;
        picture->size(&w, &h);
        ydebug("ThorvgLoader: '{}' is {}x{}", path, w, h);

        if (auto res = thorvgEngineRef(); !res) {
            return Err<VectorImage::Ptr>("ThorvgLoader: engine unavailable", res);
        }
        return VectorImage::Ptr(std::make_shared<SvgImage>(path, std::move(animation), w, h));
    }

private:
    bool _engineRef = false;
};

Result<ImageLoader::Ptr> ImageLoader::createImpl() {
    auto impl = std::make_shared<ThorvgLoader>();
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to initialize ImageLoader", res);
    }
    return Ok(Ptr(std::move(impl)));
}

} // namespace pris
