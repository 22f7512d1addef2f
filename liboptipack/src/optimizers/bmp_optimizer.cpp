#include "../../include/bmp_optimizer.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

extern "C" {
#include "bmplib.h"
}

namespace optipack {

namespace {

    const char* optimizer_tag() {
        return "BmpOptimizer";
    }

    std::string bmplib_result_to_string(const BMPRESULT res) {
        switch (res) {
            case BMP_RESULT_OK:        return "OK";
            case BMP_RESULT_INVALID:   return "Invalid pixel data";
            case BMP_RESULT_TRUNCATED: return "File truncated";
            case BMP_RESULT_INSANE:    return "Image dimensions too large";
            case BMP_RESULT_PNG:       return "Embedded PNG";
            case BMP_RESULT_JPEG:      return "Embedded JPEG";
            case BMP_RESULT_ERROR:     return "Generic error";
            case BMP_RESULT_ARRAY:     return "OS/2 Bitmap Array";
            default:                   return "Unknown result code (" + std::to_string(res) + ")";
        }
    }

    std::string describe_failure(BMPHANDLE h, const BMPRESULT res) {
        std::string err = h ? bmp_errmsg(h) : "";
        if (err.empty()) err = bmplib_result_to_string(res);
        return err;
    }

    // bmplib hands out malloc'd buffers
    struct FreeDeleter {
        void operator()(unsigned char* p) const { std::free(p); }
    };
    using malloc_ptr = std::unique_ptr<unsigned char, FreeDeleter>;

    /**
     * @brief Owns a bmplib handle together with the FILE it reads or writes.
     */
    struct ScopedBmp {
        BMPHANDLE h = nullptr;
        unique_FILE f;

        ScopedBmp(const std::filesystem::path& path, const char* mode) : f(open_file(path, mode)) {}

        ~ScopedBmp() {
            if (h) bmp_free(h);
        }

        ScopedBmp(const ScopedBmp&) = delete;
        ScopedBmp& operator=(const ScopedBmp&) = delete;
    };

} // namespace

std::optional<ByteBuffer> BmpOptimizer::optimize(const ByteView input, const OptimizationOptions&) {
    const ScopedTempDir work("bmp", optimizer_tag());
    const auto in_path = work.path() / "input.bmp";
    const auto out_path = work.path() / "output.bmp";
    write_file(in_path, input);

    ScopedBmp in(in_path, "rb");
    if (!in.f) {
        throw std::runtime_error("BmpOptimizer: cannot open staged input");
    }
    in.h = bmpread_new(in.f.get());
    if (!in.h) {
        throw std::runtime_error("BmpOptimizer: failed to create read handle");
    }

    BMPRESULT res = bmpread_load_info(in.h);
    if (res == BMP_RESULT_ARRAY) {
        Logger::log(LogLevel::Debug, "Bitmap Array left unchanged", optimizer_tag());
        return std::nullopt;
    }
    if (res != BMP_RESULT_OK) {
        throw std::runtime_error("BmpOptimizer: " + describe_failure(in.h, res));
    }

    int width, height, channels, bits;
    bmpread_dimensions(in.h, &width, &height, &channels, &bits, nullptr);
    check_pixel_budget(static_cast<std::uint64_t>(std::abs(width)), static_cast<std::uint64_t>(std::abs(height)), "BMP");
    const bool is_64bit = bmpread_is_64bit(in.h);

    malloc_ptr palette;
    const int num_colors = bmpread_num_palette_colors(in.h);
    const bool is_indexed = num_colors > 0;
    if (is_indexed) {
        unsigned char* raw_palette = nullptr;
        res = bmpread_load_palette(in.h, &raw_palette);
        palette.reset(raw_palette);
        if (res != BMP_RESULT_OK) {
            throw std::runtime_error("BmpOptimizer: failed to load palette: " + describe_failure(in.h, res));
        }
        // with a palette loaded, pixels come back as 8-bit indices
        channels = 1;
        bits = 8;
    }

    const int xdpi = bmpread_resolution_xdpi(in.h);
    const int ydpi = bmpread_resolution_ydpi(in.h);

    ByteBuffer pixels(bmpread_buffersize(in.h));
    if (pixels.empty()) {
        throw std::runtime_error("BmpOptimizer: empty pixel buffer");
    }
    unsigned char* pixel_ptr = pixels.data();
    res = bmpread_load_image(in.h, &pixel_ptr);
    if (res != BMP_RESULT_OK) {
        throw std::runtime_error("BmpOptimizer: failed to load image data: " + describe_failure(in.h, res));
    }

    {
        ScopedBmp out(out_path, "wb");
        if (!out.f) {
            throw std::runtime_error("BmpOptimizer: cannot open staged output");
        }
        out.h = bmpwrite_new(out.f.get());
        if (!out.h) {
            throw std::runtime_error("BmpOptimizer: failed to create write handle");
        }

        res = bmpwrite_set_dimensions(out.h, width, height, channels, bits);
        if (res != BMP_RESULT_OK) {
            throw std::runtime_error("BmpOptimizer: " + describe_failure(out.h, res));
        }
        if (is_64bit) {
            bmpwrite_set_64bit(out.h);
        }
        if (xdpi > 0 || ydpi > 0) {
            bmpwrite_set_resolution(out.h, xdpi, ydpi);
        }

        if (is_indexed) {
            bmpwrite_set_palette(out.h, num_colors, palette.get());
            if (num_colors <= 2) {
                bmpwrite_allow_huffman(out.h);
                bmpwrite_set_huffman_img_fg_idx(out.h, 1);
            }
            bmpwrite_set_rle(out.h, BMP_RLE_AUTO);
        } else if (!is_64bit && channels == 3 && bits == 8) {
            bmpwrite_allow_rle24(out.h);
            bmpwrite_set_rle(out.h, BMP_RLE_AUTO);
        }

        res = bmpwrite_save_image(out.h, pixels.data());
        if (res != BMP_RESULT_OK) {
            throw std::runtime_error("BmpOptimizer: failed to write image: " + describe_failure(out.h, res));
        }
    }

    return read_file(out_path);
}

} // namespace optipack
