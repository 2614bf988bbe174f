#ifndef MINHYPR_CAPTURE_HPP
#define MINHYPR_CAPTURE_HPP

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "minhypr/config.hpp"
#include "minhypr/process.hpp"
#include "minhypr/types.hpp"

namespace minhypr {

    struct ThumbnailFiles {
        std::filesystem::path thumbnail;
        std::filesystem::path icon;
    };

    // <dir>/<address>.thumb.png and <dir>/<address>.icon.png
    ThumbnailFiles        thumbnail_files(const std::filesystem::path& dir, std::string_view address);
    std::filesystem::path icon_path_for(const std::filesystem::path& thumbnail);

    // Best effort; missing files are fine.
    void                  remove_thumbnail_files(const std::optional<std::filesystem::path>& thumbnail);

    class Capturer {
      public:
        virtual ~Capturer()                                                                                              = default;
        virtual std::expected<std::filesystem::path, std::string> capture(std::string_view address, const WindowGeometry& geometry) = 0;
    };

    // grim grabs the window region, ImageMagick scales it to the thumbnail and icon sizes.
    class GrimCapturer : public Capturer {
      public:
        GrimCapturer(std::filesystem::path dir, ThumbnailSize thumbnail_size, int icon_size, ProcessRunner runner);

        std::expected<std::filesystem::path, std::string> capture(std::string_view address, const WindowGeometry& geometry) override;

      private:
        std::filesystem::path dir_;
        ThumbnailSize         thumbnail_size_;
        int                   icon_size_;
        ProcessRunner         runner_;
    };

    std::string grim_geometry(const WindowGeometry& geometry);

} // namespace minhypr

#endif // MINHYPR_CAPTURE_HPP
