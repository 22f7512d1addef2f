#include "test_support.hpp"
#include "file_utils.hpp"
#include "jpeg_optimizer.hpp"
#include <png.h>
#include <tiffio.h>
#include <webp/encode.h>
#include <webp/types.h>
#include <zlib.h>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <stdexcept>

namespace optipack::testing {

namespace {

    // deterministic pattern with enough high-frequency detail to be compressible by quality
    ByteBuffer pattern(const unsigned width, const unsigned height, const int channels) {
        ByteBuffer px(static_cast<std::size_t>(width) * height * channels);
        std::uint32_t state = 2463534242u;
        for (unsigned y = 0; y < height; ++y) {
            for (unsigned x = 0; x < width; ++x) {
                state ^= state << 13;
                state ^= state >> 17;
                state ^= state << 5;
                unsigned char* p = &px[(static_cast<std::size_t>(y) * width + x) * channels];
                p[0] = static_cast<unsigned char>((x * 255 / width + (state & 0x1f)) & 0xff);
                p[1] = static_cast<unsigned char>((y * 255 / height + ((state >> 8) & 0x1f)) & 0xff);
                p[2] = static_cast<unsigned char>(((x + y) * 4 + ((state >> 16) & 0x1f)) & 0xff);
                if (channels == 4) p[3] = 0xff;
            }
        }
        return px;
    }

    void append(png_structp png, png_bytep data, const png_size_t length) {
        auto* out = static_cast<ByteBuffer*>(png_get_io_ptr(png));
        out->insert(out->end(), data, data + length);
    }

    void no_flush(png_structp) {}

    void fail(png_structp, const png_const_charp msg) {
        throw std::runtime_error(msg);
    }

    void put_be32(ByteBuffer& out, const std::uint32_t v) {
        out.push_back(static_cast<unsigned char>(v >> 24));
        out.push_back(static_cast<unsigned char>(v >> 16));
        out.push_back(static_cast<unsigned char>(v >> 8));
        out.push_back(static_cast<unsigned char>(v));
    }

    void put_le16(ByteBuffer& out, const std::uint16_t v) {
        out.push_back(static_cast<unsigned char>(v));
        out.push_back(static_cast<unsigned char>(v >> 8));
    }

    void put_le32(ByteBuffer& out, const std::uint32_t v) {
        put_le16(out, static_cast<std::uint16_t>(v));
        put_le16(out, static_cast<std::uint16_t>(v >> 16));
    }

    // length, type, data, then a CRC over type and data
    void put_png_chunk(ByteBuffer& out, const char* type, const ByteBuffer& data, const std::uint32_t declared_length) {
        put_be32(out, declared_length);
        const std::size_t crc_from = out.size();
        out.insert(out.end(), type, type + 4);
        out.insert(out.end(), data.begin(), data.end());
        const uLong crc = crc32(0L, out.data() + crc_from, static_cast<uInt>(out.size() - crc_from));
        put_be32(out, static_cast<std::uint32_t>(crc));
    }

} // namespace

ByteBuffer make_jpeg(const unsigned width, const unsigned height, const int quality) {
    RasterImage image;
    image.width = width;
    image.height = height;
    image.components = 3;
    image.pixels = pattern(width, height, 3);
    return JpegOptimizer::encode(image, quality);
}

ByteBuffer make_png(const unsigned width, const unsigned height, const bool alpha) {
    const int channels = alpha ? 4 : 3;
    const ByteBuffer px = pattern(width, height, channels);

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, fail, nullptr);
    png_infop info = png_create_info_struct(png);
    ByteBuffer out;
    try {
        png_set_write_fn(png, &out, append, no_flush);
        png_set_compression_level(png, 0);
        png_set_IHDR(png, info, width, height, 8, alpha ? PNG_COLOR_TYPE_RGBA : PNG_COLOR_TYPE_RGB,
                     PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
        png_write_info(png, info);
        for (unsigned y = 0; y < height; ++y) {
            png_write_row(png, const_cast<png_bytep>(&px[static_cast<std::size_t>(y) * width * channels]));
        }
        png_write_end(png, nullptr);
    } catch (...) {
        png_destroy_write_struct(&png, &info);
        throw;
    }
    png_destroy_write_struct(&png, &info);
    return out;
}

ByteBuffer make_png_with_color_key(const unsigned width, const unsigned height) {
    const ByteBuffer px = pattern(width, height, 3);

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, fail, nullptr);
    png_infop info = png_create_info_struct(png);
    ByteBuffer out;
    try {
        png_set_write_fn(png, &out, append, no_flush);
        png_set_IHDR(png, info, width, height, 8, PNG_COLOR_TYPE_RGB,
                     PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
        png_color_16 key{};
        key.red = px[0];
        key.green = px[1];
        key.blue = px[2];
        png_set_tRNS(png, info, nullptr, 0, &key);
        png_write_info(png, info);
        for (unsigned y = 0; y < height; ++y) {
            png_write_row(png, const_cast<png_bytep>(&px[static_cast<std::size_t>(y) * width * 3]));
        }
        png_write_end(png, nullptr);
    } catch (...) {
        png_destroy_write_struct(&png, &info);
        throw;
    }
    png_destroy_write_struct(&png, &info);
    return out;
}

ByteBuffer make_png_header_only(const std::uint32_t width, const std::uint32_t height) {
    static constexpr unsigned char signature[] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
    ByteBuffer out(std::begin(signature), std::end(signature));

    ByteBuffer ihdr;
    put_be32(ihdr, width);
    put_be32(ihdr, height);
    ihdr.push_back(8); // bit depth
    ihdr.push_back(PNG_COLOR_TYPE_RGB);
    ihdr.push_back(0);
    ihdr.push_back(0);
    ihdr.push_back(0);
    put_png_chunk(out, "IHDR", ihdr, static_cast<std::uint32_t>(ihdr.size()));

    // declares 4096 bytes of image data, carries 16
    put_be32(out, 4096);
    const char idat[] = "IDAT";
    out.insert(out.end(), idat, idat + 4);
    out.insert(out.end(), 16, 0x78);
    return out;
}

ByteBuffer make_jpeg_declaring(const std::uint16_t width, const std::uint16_t height) {
    ByteBuffer out = make_jpeg(32, 32);
    for (std::size_t i = 2; i + 9 < out.size(); ++i) {
        if (out[i] != 0xFF) continue;
        const unsigned char marker = out[i + 1];
        if (marker == 0xC0 || marker == 0xC1 || marker == 0xC2) {
            // FFCx, length(2), precision(1), height(2), width(2)
            out[i + 5] = static_cast<unsigned char>(height >> 8);
            out[i + 6] = static_cast<unsigned char>(height);
            out[i + 7] = static_cast<unsigned char>(width >> 8);
            out[i + 8] = static_cast<unsigned char>(width);
            return out;
        }
    }
    throw std::runtime_error("no frame header in generated JPEG");
}

ByteBuffer make_tiff(const unsigned width, const unsigned height) {
    const ScopedTempDir dir("tiff-fixture");
    const auto path = dir.path() / "fixture.tif";

    TIFF* tif = TIFFOpen(path.string().c_str(), "w");
    if (!tif) throw std::runtime_error("cannot create TIFF fixture");
    TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, width);
    TIFFSetField(tif, TIFFTAG_IMAGELENGTH, height);
    TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, 3);
    TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, 8);
    TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_RGB);
    TIFFSetField(tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    TIFFSetField(tif, TIFFTAG_COMPRESSION, COMPRESSION_NONE);
    TIFFSetField(tif, TIFFTAG_ROWSPERSTRIP, height);

    ByteBuffer row(static_cast<std::size_t>(width) * 3);
    for (unsigned y = 0; y < height; ++y) {
        for (unsigned x = 0; x < width; ++x) {
            row[x * 3] = static_cast<unsigned char>(x * 255 / width);
            row[x * 3 + 1] = static_cast<unsigned char>(y * 255 / height);
            row[x * 3 + 2] = 128;
        }
        if (TIFFWriteScanline(tif, row.data(), y, 0) < 0) {
            TIFFClose(tif);
            throw std::runtime_error("cannot write TIFF fixture row");
        }
    }
    TIFFClose(tif);
    return read_file(path);
}

ByteBuffer webp_source_pixels(const unsigned width, const unsigned height) {
    return pattern(width, height, 3);
}

ByteBuffer make_webp(const unsigned width, const unsigned height, const bool lossless) {
    const ByteBuffer px = webp_source_pixels(width, height);
    const int stride = static_cast<int>(width) * 3;
    uint8_t* encoded = nullptr;
    const std::size_t size = lossless
        ? WebPEncodeLosslessRGB(px.data(), static_cast<int>(width), static_cast<int>(height), stride, &encoded)
        : WebPEncodeRGB(px.data(), static_cast<int>(width), static_cast<int>(height), stride, 75.0f, &encoded);
    if (size == 0) {
        WebPFree(encoded);
        throw std::runtime_error("cannot encode WebP fixture");
    }
    ByteBuffer out(encoded, encoded + size);
    WebPFree(encoded);
    return out;
}

ByteBuffer make_banded_bmp(const unsigned width, const unsigned height) {
    const std::uint32_t row_bytes = (width + 3) & ~3u;
    const std::uint32_t palette_bytes = 4 * 4;
    const std::uint32_t pixel_offset = 14 + 40 + palette_bytes;
    const std::uint32_t image_bytes = row_bytes * height;

    ByteBuffer out;
    out.push_back('B');
    out.push_back('M');
    put_le32(out, pixel_offset + image_bytes);
    put_le32(out, 0);
    put_le32(out, pixel_offset);

    put_le32(out, 40);
    put_le32(out, width);
    put_le32(out, height);
    put_le16(out, 1);  // planes
    put_le16(out, 8);  // bits per pixel
    put_le32(out, 0);  // BI_RGB
    put_le32(out, image_bytes);
    put_le32(out, 2835);
    put_le32(out, 2835);
    put_le32(out, 4);  // colours used
    put_le32(out, 0);

    static constexpr unsigned char palette[4][4] = {
        {0x00, 0x00, 0xff, 0}, {0x00, 0xff, 0x00, 0}, {0xff, 0x00, 0x00, 0}, {0xff, 0xff, 0xff, 0}};
    for (const auto& entry : palette) {
        out.insert(out.end(), entry, entry + 4);
    }

    // bottom-up rows, each a single palette index
    for (unsigned y = 0; y < height; ++y) {
        const auto index = static_cast<unsigned char>(y * 4 / height);
        out.insert(out.end(), width, index);
        out.insert(out.end(), row_bytes - width, 0);
    }
    return out;
}

ByteBuffer make_zip(const std::vector<ArchiveMember>& members) {
    return create_archive(members);
}

std::vector<ProgressEvent> drain(EventSubscription& subscription, const std::chrono::milliseconds deadline) {
    std::vector<ProgressEvent> events;
    const auto until = std::chrono::steady_clock::now() + deadline;
    while (!subscription.finished() && std::chrono::steady_clock::now() < until) {
        if (auto event = subscription.next(std::chrono::milliseconds(100))) {
            events.push_back(std::move(*event));
        }
    }
    return events;
}

ArchiveMember text_member(std::string name, const std::string& content) {
    return ArchiveMember{std::move(name), to_buffer(content)};
}

} // namespace optipack::testing
