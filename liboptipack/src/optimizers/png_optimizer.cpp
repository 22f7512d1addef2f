#include "../../include/png_optimizer.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <cstdint>
#include <cstring>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace optipack {

namespace {

    const char* optimizer_tag() {
        return "png_optimizer";
    }

    /**
     * @brief libpng error handler that throws a C++ exception.
     * @param msg The error message from libpng.
     */
    void png_error_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
        throw std::runtime_error(msg);
    }

    /**
     * @brief libpng warning handler.
     * @param msg The warning message from libpng.
     */
    void png_warning_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
    }

    /**
     * @brief Read cursor over an in-memory PNG.
     */
    struct MemoryReader {
        ByteView data;
        std::size_t offset = 0;
    };

    void png_read_from_memory(png_structp png, png_bytep out, const png_size_t length) {
        auto* reader = static_cast<MemoryReader*>(png_get_io_ptr(png));
        if (reader->data.size() - reader->offset < length) {
            png_error(png, "Unexpected end of PNG data");
        }
        std::memcpy(out, reader->data.data() + reader->offset, length);
        reader->offset += length;
    }

    void png_write_to_memory(png_structp png, png_bytep data, const png_size_t length) {
        auto* out = static_cast<ByteBuffer*>(png_get_io_ptr(png));
        out->insert(out->end(), data, data + length);
    }

    void png_flush_noop(png_structp) {}

    /**
     * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
     * Ensures png_destroy_read_struct is called even if exceptions occur.
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;
        MemoryReader reader;

        explicit PngRead(const ByteView data) : reader{data, 0} {
            png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
            if (!png) throw std::runtime_error("png_create_read_struct failed");
            info = png_create_info_struct(png);
            if (!info) throw std::runtime_error("png_create_info_struct failed");
            png_set_read_fn(png, &reader, png_read_from_memory);
            // IHDR beyond these fails inside png_read_info
            png_set_user_limits(png, kMaxImageDimension, kMaxImageDimension);
        }

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }

        PngRead(const PngRead&) = delete;
        PngRead& operator=(const PngRead&) = delete;
    };

    /**
     * @brief RAII wrapper for libpng write structs writing into a ByteBuffer.
     */
    struct PngWrite {
        png_structp png = nullptr;
        png_infop info = nullptr;
        ByteBuffer out;

        PngWrite() {
            png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
            if (!png) throw std::runtime_error("png_create_write_struct failed");
            info = png_create_info_struct(png);
            if (!info) throw std::runtime_error("png_create_info_struct failed (writer)");
            png_set_write_fn(png, &out, png_write_to_memory, png_flush_noop);
        }

        ~PngWrite() {
            if (png || info) png_destroy_write_struct(&png, &info);
        }

        PngWrite(const PngWrite&) = delete;
        PngWrite& operator=(const PngWrite&) = delete;
    };

    /**
     * @brief Copies colour management chunks; text, time and other ancillary chunks are dropped.
     */
    void copy_color_chunks(png_structp in_png, png_infop in_info,
                           png_structp out_png, png_infop out_info) {
        if (png_get_valid(in_png, in_info, PNG_INFO_iCCP)) {
            png_charp name = nullptr;
            int comp_type = 0;
            png_bytep profile = nullptr;
            png_uint_32 profile_len = 0;
            if (png_get_iCCP(in_png, in_info, &name, &comp_type, &profile, &profile_len)) {
                png_set_iCCP(out_png, out_info, name, comp_type, profile, profile_len);
            }
        }
        if (png_get_valid(in_png, in_info, PNG_INFO_sRGB)) {
            int intent = 0;
            if (png_get_sRGB(in_png, in_info, &intent)) {
                png_set_sRGB(out_png, out_info, intent);
            }
        }
        if (png_get_valid(in_png, in_info, PNG_INFO_gAMA)) {
            double gamma = 0.0;
            if (png_get_gAMA(in_png, in_info, &gamma)) {
                png_set_gAMA(out_png, out_info, gamma);
            }
        }
        if (png_get_valid(in_png, in_info, PNG_INFO_cHRM)) {
            double wx, wy, rx, ry, gx, gy, bx, by;
            if (png_get_cHRM(in_png, in_info, &wx, &wy, &rx, &ry, &gx, &gy, &bx, &by)) {
                png_set_cHRM(out_png, out_info, wx, wy, rx, ry, gx, gy, bx, by);
            }
        }
    }

    struct Rgba8Image {
        png_uint_32 width = 0;
        png_uint_32 height = 0;
        std::vector<unsigned char> pixels; ///< 4 bytes per pixel, rows packed
    };

    /**
     * @brief Expands whatever libpng reads (palette, gray, tRNS, interlace) to RGBA8.
     * @note png_read_info must have been called on the reader.
     */
    Rgba8Image read_to_rgba8(const PngRead& rd) {
        int bit_depth = 0;
        int color_type = 0;
        Rgba8Image img;
        png_get_IHDR(rd.png, rd.info, &img.width, &img.height, &bit_depth, &color_type, nullptr, nullptr, nullptr);
        check_pixel_budget(img.width, img.height, "PNG");

        switch (color_type) {
            case PNG_COLOR_TYPE_PALETTE:
                png_set_palette_to_rgb(rd.png);
                break;
            case PNG_COLOR_TYPE_GRAY:
            case PNG_COLOR_TYPE_GRAY_ALPHA:
                if (bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
                png_set_gray_to_rgb(rd.png);
                break;
            default:
                break;
        }
        if (png_get_valid(rd.png, rd.info, PNG_INFO_tRNS)) {
            png_set_tRNS_to_alpha(rd.png);
        } else if ((color_type & PNG_COLOR_MASK_ALPHA) == 0) {
            png_set_filler(rd.png, 0xFF, PNG_FILLER_AFTER);
        }
        png_set_interlace_handling(rd.png);
        png_read_update_info(rd.png, rd.info);

        const std::size_t stride = static_cast<std::size_t>(img.width) * 4;
        if (png_get_rowbytes(rd.png, rd.info) != stride) {
            throw std::runtime_error("PNG did not expand to 8-bit RGBA");
        }

        img.pixels.resize(stride * img.height);
        std::vector<png_bytep> rows(img.height);
        for (png_uint_32 y = 0; y < img.height; ++y) {
            rows[y] = img.pixels.data() + y * stride;
        }
        png_read_image(rd.png, rows.data());
        png_read_end(rd.png, nullptr);
        return img;
    }

    /**
     * @brief What the pixels allow the output colour type to be reduced to.
     */
    struct ColorProfile {
        bool gray = true;   ///< r == g == b everywhere
        bool opaque = true; ///< alpha == 255 everywhere
        bool fits_palette = true;
        std::unordered_map<std::uint32_t, png_byte> index; ///< rgba -> palette slot
        std::vector<png_color> palette;
        std::vector<png_byte> alpha;
    };

    std::uint32_t rgba_key(const unsigned char* px) {
        std::uint32_t key = 0;
        std::memcpy(&key, px, sizeof key);
        return key;
    }

    ColorProfile profile_pixels(const Rgba8Image& img) {
        ColorProfile prof;
        const std::size_t count = static_cast<std::size_t>(img.width) * img.height;
        for (std::size_t i = 0; i < count; ++i) {
            const unsigned char* px = &img.pixels[i * 4];
            prof.gray = prof.gray && px[0] == px[1] && px[1] == px[2];
            prof.opaque = prof.opaque && px[3] == 0xFF;
            if (!prof.fits_palette) continue;

            const std::uint32_t key = rgba_key(px);
            if (prof.index.contains(key)) continue;
            if (prof.palette.size() == 256) {
                prof.fits_palette = false;
                prof.index.clear();
                continue;
            }
            prof.index.emplace(key, static_cast<png_byte>(prof.palette.size()));
            prof.palette.push_back(png_color{px[0], px[1], px[2]});
            prof.alpha.push_back(px[3]);
        }
        return prof;
    }

    int reduced_color_type(const ColorProfile& prof, const int in_color_type, const bool has_icc) {
        // an ICC profile only describes the colour class it was written for
        const bool gray_input = (in_color_type & PNG_COLOR_MASK_COLOR) == 0;
        const bool gray = prof.gray && (!has_icc || gray_input);
        const bool palette = prof.fits_palette && (!has_icc || !gray_input);

        if (gray && prof.opaque) return PNG_COLOR_TYPE_GRAY;
        if (palette) return PNG_COLOR_TYPE_PALETTE;
        if (gray) return PNG_COLOR_TYPE_GA;
        return prof.opaque ? PNG_COLOR_TYPE_RGB : PNG_COLOR_TYPE_RGBA;
    }

    void pack_row(const int color_type, const ColorProfile& prof,
                  const unsigned char* src, unsigned char* dst, const png_uint_32 width) {
        for (png_uint_32 x = 0; x < width; ++x, src += 4) {
            switch (color_type) {
                case PNG_COLOR_TYPE_PALETTE:
                    *dst++ = prof.index.at(rgba_key(src));
                    break;
                case PNG_COLOR_TYPE_GRAY:
                    *dst++ = src[0];
                    break;
                case PNG_COLOR_TYPE_GA:
                    *dst++ = src[0];
                    *dst++ = src[3];
                    break;
                case PNG_COLOR_TYPE_RGB:
                    dst = std::copy_n(src, 3, dst);
                    break;
                default:
                    dst = std::copy_n(src, 4, dst);
                    break;
            }
        }
    }

} // namespace

bool PngOptimizer::has_alpha_channel(const ByteView input) {
    PngRead rd(input);
    png_read_info(rd.png, rd.info);
    const int color_type = png_get_color_type(rd.png, rd.info);
    return (color_type & PNG_COLOR_MASK_ALPHA) != 0 ||
           png_get_valid(rd.png, rd.info, PNG_INFO_tRNS) != 0;
}

RasterImage PngOptimizer::decode_opaque(const ByteView input) {
    PngRead rd(input);
    png_read_info(rd.png, rd.info);

    png_uint_32 width, height;
    int bit_depth, color_type;
    png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);
    check_pixel_budget(width, height, "PNG");

    if (bit_depth == 16) png_set_strip_16(rd.png);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(rd.png);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
    if (color_type & PNG_COLOR_MASK_ALPHA) png_set_strip_alpha(rd.png);
    png_set_interlace_handling(rd.png);
    png_read_update_info(rd.png, rd.info);

    RasterImage image;
    image.width = width;
    image.height = height;
    image.components = static_cast<int>(png_get_channels(rd.png, rd.info));
    if (image.components != 1 && image.components != 3) {
        throw std::runtime_error("Unexpected channel count after PNG expansion: " + std::to_string(image.components));
    }

    const std::size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
    image.pixels.resize(rowbytes * height);
    std::vector<png_bytep> row_pointers(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        row_pointers[y] = image.pixels.data() + y * rowbytes;
    }
    png_read_image(rd.png, row_pointers.data());
    png_read_end(rd.png, nullptr);
    return image;
}

// decode to RGBA8, pick the smallest colour type the pixels allow, rewrite at zlib level 9
std::optional<ByteBuffer> PngOptimizer::optimize(const ByteView input, const OptimizationOptions&) {
    PngRead rd(input);
    png_read_info(rd.png, rd.info);

    if (png_get_bit_depth(rd.png, rd.info) == 16) {
        // reducing to 8 bits would lose precision
        Logger::log(LogLevel::Debug, "16-bit PNG left unchanged", optimizer_tag());
        return std::nullopt;
    }
    const int in_color_type = png_get_color_type(rd.png, rd.info);
    const bool has_icc = png_get_valid(rd.png, rd.info, PNG_INFO_iCCP) != 0;

    const Rgba8Image img = read_to_rgba8(rd);
    const ColorProfile prof = profile_pixels(img);
    const int out_color_type = reduced_color_type(prof, in_color_type, has_icc);

    PngWrite wr;
    png_set_compression_level(wr.png, Z_BEST_COMPRESSION);
    png_set_compression_mem_level(wr.png, 9);
    png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);
    png_set_filter(wr.png, PNG_FILTER_TYPE_BASE, PNG_ALL_FILTERS);
    png_set_IHDR(wr.png, wr.info, img.width, img.height, 8, out_color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);

    if (out_color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_PLTE(wr.png, wr.info, prof.palette.data(), static_cast<int>(prof.palette.size()));
        if (!prof.opaque) {
            png_set_tRNS(wr.png, wr.info, prof.alpha.data(), static_cast<int>(prof.alpha.size()), nullptr);
        }
    }
    copy_color_chunks(rd.png, rd.info, wr.png, wr.info);
    png_write_info(wr.png, wr.info);

    std::vector<unsigned char> row(static_cast<std::size_t>(img.width) * png_get_channels(wr.png, wr.info));
    const std::size_t stride = static_cast<std::size_t>(img.width) * 4;
    for (png_uint_32 y = 0; y < img.height; ++y) {
        pack_row(out_color_type, prof, &img.pixels[y * stride], row.data(), img.width);
        png_write_row(wr.png, row.data());
    }
    png_write_end(wr.png, nullptr);

    Logger::log(LogLevel::Debug,
                "PNG re-encoded as colour type " + std::to_string(out_color_type) + ": " +
                std::to_string(input.size()) + " -> " + std::to_string(wr.out.size()) + " bytes",
                optimizer_tag());
    return std::move(wr.out);
}

} // namespace optipack
