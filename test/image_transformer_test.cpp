#include "image_transformer.hpp"
#include "jpeg_optimizer.hpp"
#include "png_optimizer.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <webp/decode.h>
#include <algorithm>
#include <memory>

using namespace optipack;
using optipack::testing::make_jpeg;
using optipack::testing::make_png;
namespace fixtures = optipack::testing;

class ImageTransformerTest : public ::testing::Test {
protected:
    OptimizerRegistry registry;
    ImageTransformer transformer{registry};

    static OptimizationOptions options(const int quality, const bool convert = false) {
        OptimizationOptions o;
        o.jpeg_quality = quality;
        o.convert_png_to_jpeg = convert;
        return o;
    }
};

TEST_F(ImageTransformerTest, JpegIsReencodedAtQuality) {
    const auto src = make_jpeg(160, 120, 98);
    const auto out = transformer.transform("a.jpg", src, ImageFormat::Jpeg, options(60));

    EXPECT_EQ(out.result.status, ResultStatus::Success);
    EXPECT_EQ(out.result.name, "a.jpg");
    EXPECT_EQ(out.result.output_name, "a.jpg");
    EXPECT_EQ(out.result.original_size, src.size());
    EXPECT_EQ(out.result.optimized_size, out.bytes.size());
    EXPECT_LT(out.bytes.size(), src.size());
    EXPECT_GT(out.result.saving_percentage, 0.0);
    EXPECT_FALSE(out.result.error_detail.has_value());

    const auto decoded = JpegOptimizer::decode(out.bytes);
    EXPECT_EQ(decoded.width, 160u);
    EXPECT_EQ(decoded.height, 120u);
}

TEST_F(ImageTransformerTest, LowerQualityNeverProducesLargerJpeg) {
    const auto src = make_jpeg(200, 150, 98);
    const auto q100 = transformer.transform("a.jpg", src, ImageFormat::Jpeg, options(100));
    const auto q90 = transformer.transform("a.jpg", src, ImageFormat::Jpeg, options(90));
    const auto q30 = transformer.transform("a.jpg", src, ImageFormat::Jpeg, options(30));
    const auto q1 = transformer.transform("a.jpg", src, ImageFormat::Jpeg, options(1));
    EXPECT_LE(q1.result.optimized_size, q30.result.optimized_size);
    EXPECT_LE(q30.result.optimized_size, q90.result.optimized_size);
    EXPECT_LE(q90.result.optimized_size, q100.result.optimized_size);
}

TEST_F(ImageTransformerTest, JpegReencodeMayGrowAndReportsNegativeSaving) {
    const auto src = make_jpeg(64, 64, 20);
    const auto out = transformer.transform("small.jpg", src, ImageFormat::Jpeg, options(100));
    EXPECT_EQ(out.result.status, ResultStatus::Success);
    EXPECT_GT(out.bytes.size(), src.size());
    EXPECT_LT(out.result.saving_percentage, 0.0);
}

TEST_F(ImageTransformerTest, TruncatedJpegIsErrorWithOriginalBytes) {
    auto src = make_jpeg(160, 120);
    src.resize(src.size() / 2);
    const auto out = transformer.transform("image.jpg", src, ImageFormat::Jpeg, options(80));

    EXPECT_EQ(out.result.status, ResultStatus::Error);
    ASSERT_TRUE(out.result.error_detail.has_value());
    EXPECT_FALSE(out.result.error_detail->empty());
    EXPECT_EQ(out.bytes, src);
    EXPECT_DOUBLE_EQ(out.result.saving_percentage, 0.0);
}

TEST_F(ImageTransformerTest, PngLosslessPassShrinksUncompressedPng) {
    const auto src = make_png(96, 64);
    const auto out = transformer.transform("b.png", src, ImageFormat::Png, options(80));

    EXPECT_EQ(out.result.status, ResultStatus::Success);
    EXPECT_FALSE(out.result.converted);
    EXPECT_EQ(out.result.output_name, "b.png");
    EXPECT_LT(out.bytes.size(), src.size());

    const auto before = PngOptimizer::decode_opaque(src);
    const auto after = PngOptimizer::decode_opaque(out.bytes);
    EXPECT_EQ(before.pixels, after.pixels);
}

TEST_F(ImageTransformerTest, OpaquePngIsConvertedWhenRequested) {
    const auto src = make_png(96, 64);
    const auto out = transformer.transform("shots/b.png", src, ImageFormat::Png, options(80, true));

    EXPECT_EQ(out.result.status, ResultStatus::Success);
    EXPECT_TRUE(out.result.converted);
    EXPECT_EQ(out.result.output_name, "shots/b.jpg");
    const auto decoded = JpegOptimizer::decode(out.bytes);
    EXPECT_EQ(decoded.width, 96u);
    EXPECT_EQ(decoded.height, 64u);
}

TEST_F(ImageTransformerTest, PngWithAlphaChannelIsNeverConverted) {
    // every pixel is opaque, the channel alone blocks conversion
    const auto src = make_png(48, 48, true);
    ASSERT_TRUE(PngOptimizer::has_alpha_channel(src));

    const auto out = transformer.transform("logo.png", src, ImageFormat::Png, options(80, true));
    EXPECT_FALSE(out.result.converted);
    EXPECT_EQ(out.result.output_name, "logo.png");
    EXPECT_NE(out.result.status, ResultStatus::Error);
}

TEST_F(ImageTransformerTest, ColorKeyedPngCountsAsTransparent) {
    const auto src = fixtures::make_png_with_color_key(48, 48);
    ASSERT_TRUE(PngOptimizer::has_alpha_channel(src));

    const auto out = transformer.transform("key.png", src, ImageFormat::Png, options(80, true));
    EXPECT_FALSE(out.result.converted);
    EXPECT_EQ(out.result.output_name, "key.png");
    EXPECT_NE(out.result.status, ResultStatus::Error);
    if (out.result.status == ResultStatus::Success) {
        EXPECT_TRUE(PngOptimizer::has_alpha_channel(out.bytes));
    }
}

TEST_F(ImageTransformerTest, OversizedPngHeaderIsErrorBeforeDecoding) {
    const auto huge = fixtures::make_png_header_only(900000, 900000);
    const auto out = transformer.transform("huge.png", huge, ImageFormat::Png, options(80, true));
    EXPECT_EQ(out.result.status, ResultStatus::Error);
    EXPECT_TRUE(out.result.error_detail.has_value());
    EXPECT_EQ(out.bytes, huge);

    // within libpng's side limit but over the pixel budget
    const auto wide = fixtures::make_png_header_only(40000, 40000);
    const auto lossless = transformer.transform("wide.png", wide, ImageFormat::Png, options(80));
    EXPECT_EQ(lossless.result.status, ResultStatus::Error);
    const auto converted = transformer.transform("wide.png", wide, ImageFormat::Png, options(80, true));
    EXPECT_EQ(converted.result.status, ResultStatus::Error);
}

TEST_F(ImageTransformerTest, OversizedJpegHeaderIsErrorBeforeDecoding) {
    const auto src = fixtures::make_jpeg_declaring(60000, 60000);
    const auto out = transformer.transform("huge.jpg", src, ImageFormat::Jpeg, options(80));
    EXPECT_EQ(out.result.status, ResultStatus::Error);
    ASSERT_TRUE(out.result.error_detail.has_value());
    EXPECT_NE(out.result.error_detail->find("limit"), std::string::npos);
    EXPECT_EQ(out.bytes, src);
}

TEST_F(ImageTransformerTest, UncompressedTiffIsDeflated) {
    const auto src = fixtures::make_tiff(96, 96);
    const auto out = transformer.transform("scan.tif", src, ImageFormat::Tiff, options(80));
    EXPECT_EQ(out.result.status, ResultStatus::Success);
    EXPECT_EQ(out.result.output_name, "scan.tif");
    EXPECT_LT(out.bytes.size(), src.size());
    ASSERT_GE(out.bytes.size(), 4u);
    EXPECT_TRUE((out.bytes[0] == 'I' && out.bytes[1] == 'I') || (out.bytes[0] == 'M' && out.bytes[1] == 'M'));
}

TEST_F(ImageTransformerTest, LosslessWebpKeepsItsPixels) {
    const auto src = fixtures::make_webp(64, 48, true);
    const auto out = transformer.transform("icon.webp", src, ImageFormat::Webp, options(80));
    ASSERT_NE(out.result.status, ResultStatus::Error);
    EXPECT_LE(out.bytes.size(), src.size());

    int width = 0, height = 0;
    const std::unique_ptr<uint8_t, decltype(&WebPFree)> decoded(
        WebPDecodeRGB(out.bytes.data(), out.bytes.size(), &width, &height), &WebPFree);
    ASSERT_TRUE(decoded);
    ASSERT_EQ(width, 64);
    ASSERT_EQ(height, 48);
    const auto expected = fixtures::webp_source_pixels(64, 48);
    EXPECT_TRUE(std::equal(expected.begin(), expected.end(), decoded.get()));
}

TEST_F(ImageTransformerTest, LossyWebpIsLeftAlone) {
    const auto src = fixtures::make_webp(64, 48, false);
    const auto out = transformer.transform("photo.webp", src, ImageFormat::Webp, options(10));
    EXPECT_EQ(out.result.status, ResultStatus::Skipped);
    EXPECT_EQ(out.bytes, src);
    EXPECT_DOUBLE_EQ(out.result.saving_percentage, 0.0);
}

TEST_F(ImageTransformerTest, FlatBmpIsRunLengthEncoded) {
    const auto src = fixtures::make_banded_bmp(128, 128);
    const auto out = transformer.transform("bands.bmp", src, ImageFormat::Bmp, options(80));
    EXPECT_EQ(out.result.status, ResultStatus::Success);
    EXPECT_LT(out.bytes.size(), src.size());
    ASSERT_GE(out.bytes.size(), 2u);
    EXPECT_EQ(out.bytes[0], 'B');
    EXPECT_EQ(out.bytes[1], 'M');
}

TEST_F(ImageTransformerTest, GifIsStoredUnchanged) {
    const auto src = to_buffer("GIF89a-not-really-decoded");
    const auto out = transformer.transform("anim.gif", src, ImageFormat::Gif, options(80));
    EXPECT_EQ(out.result.status, ResultStatus::Skipped);
    EXPECT_EQ(out.bytes, src);
    EXPECT_EQ(out.result.optimized_size, out.result.original_size);
}

TEST_F(ImageTransformerTest, UnknownFormatIsErrorAndPreserved) {
    const auto src = to_buffer("just text pretending to be an image");
    const auto out = transformer.transform("mystery.jpg", src, ImageFormat::Unknown, options(80));
    EXPECT_EQ(out.result.status, ResultStatus::Error);
    EXPECT_TRUE(out.result.error_detail.has_value());
    EXPECT_EQ(out.bytes, src);
}

TEST_F(ImageTransformerTest, ConvertedName) {
    EXPECT_EQ(ImageTransformer::converted_name("b.png"), "b.jpg");
    EXPECT_EQ(ImageTransformer::converted_name("dir/Photo.PNG"), "dir/Photo.jpg");
}
