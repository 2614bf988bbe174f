#include "minhypr/capture.hpp"

#include <cctype>
#include <system_error>
#include <vector>

#include "minhypr/logging.hpp"

namespace minhypr {

    namespace {

        std::string file_stem(std::string_view address) {
            std::string stem;
            stem.reserve(address.size());
            for (const char ch : address) {
                stem.push_back(std::isalnum(static_cast<unsigned char>(ch)) ? ch : '_');
            }
            return stem.empty() ? std::string("window") : stem;
        }

        std::vector<std::string> resize_command(const std::filesystem::path& source, const std::filesystem::path& target, int width, int height) {
            const auto size = std::to_string(width) + "x" + std::to_string(height);
            return {"convert", source.string(), "-resize", size + "^", "-gravity", "center", "-extent", size, "-quality", "90", target.string()};
        }

        void remove_quietly(const std::filesystem::path& path) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }

    } // namespace

    ThumbnailFiles thumbnail_files(const std::filesystem::path& dir, std::string_view address) {
        const auto stem = file_stem(address);
        return ThumbnailFiles{
            .thumbnail = dir / (stem + ".thumb.png"),
            .icon      = dir / (stem + ".icon.png"),
        };
    }

    std::filesystem::path icon_path_for(const std::filesystem::path& thumbnail) {
        constexpr std::string_view kSuffix = ".thumb.png";
        auto                       name    = thumbnail.filename().string();
        if (name.ends_with(kSuffix)) {
            name.replace(name.size() - kSuffix.size(), kSuffix.size(), ".icon.png");
        } else {
            name += ".icon.png";
        }
        return thumbnail.parent_path() / name;
    }

    void remove_thumbnail_files(const std::optional<std::filesystem::path>& thumbnail) {
        if (!thumbnail || thumbnail->empty()) {
            return;
        }
        remove_quietly(*thumbnail);
        remove_quietly(icon_path_for(*thumbnail));
    }

    std::string grim_geometry(const WindowGeometry& geometry) {
        return std::to_string(geometry.x) + "," + std::to_string(geometry.y) + " " + std::to_string(geometry.width) + "x" + std::to_string(geometry.height);
    }

    GrimCapturer::GrimCapturer(std::filesystem::path dir, ThumbnailSize thumbnail_size, int icon_size, ProcessRunner runner) :
        dir_(std::move(dir)), thumbnail_size_(thumbnail_size), icon_size_(icon_size), runner_(std::move(runner)) {}

    std::expected<std::filesystem::path, std::string> GrimCapturer::capture(std::string_view address, const WindowGeometry& geometry) {
        if (geometry.width <= 0 || geometry.height <= 0) {
            return std::unexpected(std::string("window has no visible area"));
        }

        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec) {
            return std::unexpected("unable to create " + dir_.string() + ": " + ec.message());
        }

        const auto files   = thumbnail_files(dir_, address);
        const auto capture = dir_ / (files.thumbnail.stem().string() + ".capture.png");

        if (auto grabbed = run_checked(runner_, {"grim", "-g", grim_geometry(geometry), capture.string()}); !grabbed) {
            remove_quietly(capture);
            return std::unexpected(grabbed.error());
        }

        auto thumb = run_checked(runner_, resize_command(capture, files.thumbnail, thumbnail_size_.width, thumbnail_size_.height));
        if (!thumb) {
            remove_quietly(capture);
            remove_quietly(files.thumbnail);
            return std::unexpected(thumb.error());
        }
        // The thumbnail is usable without an icon; the picker falls back to it.
        if (const auto icon = run_checked(runner_, resize_command(capture, files.icon, icon_size_, icon_size_)); !icon) {
            error_log("capture", "icon: " + icon.error());
        }
        remove_quietly(capture);
        return files.thumbnail;
    }

} // namespace minhypr
