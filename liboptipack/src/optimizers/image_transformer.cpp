#include "../../include/image_transformer.hpp"
#include "../../include/jpeg_optimizer.hpp"
#include "../../include/logger.hpp"
#include "../../include/png_optimizer.hpp"
#include <filesystem>
#include <new>
#include <stdexcept>
#include <string>

namespace optipack {

namespace {

    const char* transformer_tag() {
        return "ImageTransformer";
    }

    TransformOutput make_output(const std::string_view name, const ImageFormat format, const ByteView original,
                                ByteBuffer bytes, const ResultStatus status) {
        TransformOutput out;
        out.result.name = std::string(name);
        out.result.output_name = out.result.name;
        out.result.format = format;
        out.result.original_size = original.size();
        out.result.optimized_size = bytes.size();
        out.result.saving_percentage = compute_saving_percentage(original.size(), bytes.size());
        out.result.status = status;
        out.bytes = std::move(bytes);
        return out;
    }

    TransformOutput passthrough(const std::string_view name, const ImageFormat format, const ByteView original,
                                const ResultStatus status) {
        return make_output(name, format, original, ByteBuffer(original.begin(), original.end()), status);
    }

    TransformOutput failed(const std::string_view name, const ImageFormat format, const ByteView original,
                           std::string detail) {
        if (detail.empty()) detail = "decode failed";
        Logger::log(LogLevel::Warning, std::string(name) + ": " + detail, transformer_tag());
        auto out = passthrough(name, format, original, ResultStatus::Error);
        out.result.error_detail = std::move(detail);
        return out;
    }

} // namespace

std::string ImageTransformer::converted_name(const std::string_view name) {
    std::filesystem::path path{std::string(name)};
    path.replace_extension(".jpg");
    return path.generic_string();
}

TransformOutput ImageTransformer::transform(const std::string_view name,
                                            const ByteView bytes,
                                            const ImageFormat declared_format,
                                            const OptimizationOptions& options) const {
    if (declared_format == ImageFormat::Unknown) {
        return failed(name, declared_format, bytes, "unrecognized image format");
    }

    IImageOptimizer* optimizer = registry_.find(declared_format);
    if (!optimizer) {
        Logger::log(LogLevel::Debug, std::string(name) + ": no optimizer for " +
                    std::string(image_format_to_string(declared_format)), transformer_tag());
        return passthrough(name, declared_format, bytes, ResultStatus::Skipped);
    }

    try {
        if (declared_format == ImageFormat::Png && options.convert_png_to_jpeg &&
            !PngOptimizer::has_alpha_channel(bytes)) {
            const RasterImage image = PngOptimizer::decode_opaque(bytes);
            auto out = make_output(name, declared_format, bytes,
                                   JpegOptimizer::encode(image, options.jpeg_quality),
                                   ResultStatus::Success);
            out.result.output_name = converted_name(name);
            out.result.converted = true;
            return out;
        }

        std::optional<ByteBuffer> candidate = optimizer->optimize(bytes, options);
        if (!candidate) {
            return passthrough(name, declared_format, bytes, ResultStatus::Skipped);
        }
        if (!optimizer->always_replace() && candidate->size() >= bytes.size()) {
            Logger::log(LogLevel::Debug, std::string(name) + ": no size improvement", transformer_tag());
            return passthrough(name, declared_format, bytes, ResultStatus::Skipped);
        }
        return make_output(name, declared_format, bytes, std::move(*candidate), ResultStatus::Success);
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        return failed(name, declared_format, bytes, e.what());
    }
}

} // namespace optipack
