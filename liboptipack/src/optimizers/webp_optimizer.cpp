#include "../../include/webp_optimizer.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <memory>
#include <stdexcept>

namespace optipack {

namespace {

    const char* optimizer_tag() {
        return "webp_optimizer";
    }

    struct WebPFreeDeleter {
        void operator()(uint8_t* p) const { WebPFree(p); }
    };

    /**
     * @brief Owns a WebPPicture and the memory writer it encodes into.
     */
    struct WebPEncodeState {
        WebPPicture picture{};
        WebPMemoryWriter writer{};

        WebPEncodeState() {
            if (!WebPPictureInit(&picture)) {
                throw std::runtime_error("WebpOptimizer: WebPPictureInit failed");
            }
            WebPMemoryWriterInit(&writer);
            picture.writer = WebPMemoryWrite;
            picture.custom_ptr = &writer;
        }

        ~WebPEncodeState() {
            WebPPictureFree(&picture);
            WebPMemoryWriterClear(&writer);
        }

        WebPEncodeState(const WebPEncodeState&) = delete;
        WebPEncodeState& operator=(const WebPEncodeState&) = delete;
    };

} // namespace

std::optional<ByteBuffer> WebpOptimizer::optimize(const ByteView input, const OptimizationOptions&) {
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(input.data(), input.size(), &features) != VP8_STATUS_OK) {
        throw std::runtime_error("WebpOptimizer: feature detection failed");
    }

    if (features.has_animation) {
        Logger::log(LogLevel::Debug, "Animated WebP left unchanged", optimizer_tag());
        return std::nullopt;
    }
    check_pixel_budget(static_cast<std::uint64_t>(features.width), static_cast<std::uint64_t>(features.height), "WebP");
    // 2 = lossless, re-encoding lossy content would be a second generation loss
    if (features.format != 2) {
        Logger::log(LogLevel::Debug, "Lossy WebP left unchanged", optimizer_tag());
        return std::nullopt;
    }

    int width = 0, height = 0;
    std::unique_ptr<uint8_t, WebPFreeDeleter> decoded(
        WebPDecodeRGBA(input.data(), input.size(), &width, &height));
    if (!decoded) {
        throw std::runtime_error("WebpOptimizer: decode failed");
    }

    WebPConfig config;
    if (!WebPConfigInit(&config)) {
        throw std::runtime_error("WebpOptimizer: WebPConfigInit failed");
    }
    if (!WebPConfigLosslessPreset(&config, 9)) {
        throw std::runtime_error("WebpOptimizer: WebPConfigLosslessPreset failed");
    }
    config.exact = 1; // keep RGB under fully transparent pixels

    WebPEncodeState state;
    state.picture.use_argb = 1;
    state.picture.width = width;
    state.picture.height = height;
    if (!WebPPictureImportRGBA(&state.picture, decoded.get(), width * 4)) {
        throw std::runtime_error("WebpOptimizer: WebPPictureImportRGBA failed");
    }
    decoded.reset();

    if (!WebPEncode(&config, &state.picture)) {
        throw std::runtime_error("WebpOptimizer: WebPEncode failed, error code " +
                                 std::to_string(static_cast<int>(state.picture.error_code)));
    }

    return ByteBuffer(state.writer.mem, state.writer.mem + state.writer.size);
}

} // namespace optipack
