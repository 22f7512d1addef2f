#include "../../include/jpeg_optimizer.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    optipack::Logger::log(optipack::LogLevel::Debug, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

/**
 * @brief Routes libjpeg warnings to the logger instead of stderr.
 */
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    optipack::Logger::log(optipack::LogLevel::Debug, std::string("libjpeg: ") + buffer, "libjpeg");
}

void install_error_handlers(JpegErrorMgr& mgr, jpeg_error_mgr*& slot) {
    slot = jpeg_std_error(&mgr.pub);
    mgr.pub.error_exit = jpeg_error_exit_throw;
    mgr.pub.output_message = jpeg_output_message_log;
}

/**
 * @brief RAII owner of a decompressor; destroys it on every path.
 */
struct JpegDecompress {
    jpeg_decompress_struct info{};
    JpegErrorMgr err{};
    bool created = false;

    JpegDecompress() {
        install_error_handlers(err, info.err);
        jpeg_create_decompress(&info);
        created = true;
    }
    ~JpegDecompress() {
        if (created) jpeg_destroy_decompress(&info);
    }
    JpegDecompress(const JpegDecompress&) = delete;
    JpegDecompress& operator=(const JpegDecompress&) = delete;
};

/**
 * @brief RAII owner of a compressor and its jpeg_mem_dest buffer.
 */
struct JpegCompress {
    jpeg_compress_struct info{};
    JpegErrorMgr err{};
    unsigned char* out = nullptr;
    unsigned long out_size = 0;
    bool created = false;

    JpegCompress() {
        install_error_handlers(err, info.err);
        jpeg_create_compress(&info);
        created = true;
    }
    ~JpegCompress() {
        if (created) jpeg_destroy_compress(&info);
        // jpeg_mem_dest buffers are malloc'ed by libjpeg and owned by the caller
        std::free(out);
    }
    JpegCompress(const JpegCompress&) = delete;
    JpegCompress& operator=(const JpegCompress&) = delete;
};

} // namespace

namespace optipack {

static const char* optimizer_tag() {
    return "jpeg_optimizer";
}

RasterImage JpegOptimizer::decode(const ByteView input, bool* progressive) {
    if (input.empty()) {
        throw std::runtime_error("Empty JPEG input");
    }

    JpegDecompress dec;
    jpeg_mem_src(&dec.info, input.data(), static_cast<unsigned long>(input.size()));

    if (jpeg_read_header(&dec.info, TRUE) != JPEG_HEADER_OK) {
        throw std::runtime_error("Invalid JPEG header");
    }
    // progressive sources allocate whole-image coefficient buffers in jpeg_start_decompress
    check_pixel_budget(dec.info.image_width, dec.info.image_height, "JPEG");

    if (progressive) *progressive = dec.info.progressive_mode != 0;

    switch (dec.info.jpeg_color_space) {
        case JCS_GRAYSCALE:
            dec.info.out_color_space = JCS_GRAYSCALE;
            break;
        case JCS_CMYK:
        case JCS_YCCK:
            dec.info.out_color_space = JCS_CMYK;
            break;
        default:
            dec.info.out_color_space = JCS_RGB;
            break;
    }

    jpeg_start_decompress(&dec.info);

    RasterImage image;
    image.width = dec.info.output_width;
    image.height = dec.info.output_height;
    image.components = dec.info.output_components;
    const std::size_t row_stride = static_cast<std::size_t>(image.width) * image.components;
    image.pixels.resize(row_stride * image.height);

    while (dec.info.output_scanline < dec.info.output_height) {
        JSAMPROW row = image.pixels.data() + static_cast<std::size_t>(dec.info.output_scanline) * row_stride;
        jpeg_read_scanlines(&dec.info, &row, 1);
    }
    jpeg_finish_decompress(&dec.info);

    // corrupt data (e.g. premature end of data) is only a warning to libjpeg
    if (dec.info.err->num_warnings > 0) {
        char buffer[JMSG_LENGTH_MAX];
        (*dec.info.err->format_message)(reinterpret_cast<j_common_ptr>(&dec.info), buffer);
        throw std::runtime_error(std::string("Corrupt JPEG data: ") + buffer);
    }

    Logger::log(LogLevel::Debug,
                "Decoded JPEG " + std::to_string(image.width) + "x" + std::to_string(image.height) +
                " components=" + std::to_string(image.components),
                optimizer_tag());
    return image;
}

ByteBuffer JpegOptimizer::encode(const RasterImage& image, const int quality, const bool progressive) {
    if (image.width == 0 || image.height == 0) {
        throw std::runtime_error("Cannot encode an empty image");
    }

    JpegCompress enc;
    jpeg_mem_dest(&enc.info, &enc.out, &enc.out_size);

    enc.info.image_width = image.width;
    enc.info.image_height = image.height;
    enc.info.input_components = image.components;
    switch (image.components) {
        case 1: enc.info.in_color_space = JCS_GRAYSCALE; break;
        case 3: enc.info.in_color_space = JCS_RGB; break;
        case 4: enc.info.in_color_space = JCS_CMYK; break;
        default:
            throw std::runtime_error("Unsupported component count: " + std::to_string(image.components));
    }

    jpeg_set_defaults(&enc.info);
    jpeg_set_quality(&enc.info, quality, TRUE);
    enc.info.optimize_coding = TRUE;
    if (progressive) {
        jpeg_simple_progression(&enc.info);
    }

    jpeg_start_compress(&enc.info, TRUE);
    const std::size_t row_stride = static_cast<std::size_t>(image.width) * image.components;
    while (enc.info.next_scanline < enc.info.image_height) {
        // libjpeg takes non-const rows but does not modify them
        auto* row = const_cast<JSAMPLE*>(image.pixels.data() + static_cast<std::size_t>(enc.info.next_scanline) * row_stride);
        jpeg_write_scanlines(&enc.info, &row, 1);
    }
    jpeg_finish_compress(&enc.info);

    return {enc.out, enc.out + enc.out_size};
}

std::optional<ByteBuffer> JpegOptimizer::optimize(const ByteView input, const OptimizationOptions& options) {
    bool progressive = false;
    const RasterImage image = decode(input, &progressive);
    ByteBuffer out = encode(image, options.jpeg_quality, progressive);
    Logger::log(LogLevel::Debug,
                "JPEG re-encoded at quality " + std::to_string(options.jpeg_quality) + ": " +
                std::to_string(input.size()) + " -> " + std::to_string(out.size()) + " bytes",
                optimizer_tag());
    return out;
}

} // namespace optipack
