#include "../../include/tiff_optimizer.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <tiffio.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <vector>

namespace optipack {

namespace {

    const char* optimizer_tag() {
        return "tiff_optimizer";
    }

    struct TiffCloser {
        void operator()(TIFF* tif) const { if (tif) TIFFClose(tif); }
    };
    using unique_TIFF = std::unique_ptr<TIFF, TiffCloser>;

    // deflate with horizontal differencing, plus the tags that affect rendering
    void set_output_tags(TIFF* in, TIFF* out) {
        TIFFSetField(out, TIFFTAG_COMPRESSION, COMPRESSION_ADOBE_DEFLATE);
        TIFFSetField(out, TIFFTAG_PREDICTOR, 2);
        TIFFSetField(out, TIFFTAG_ZIPQUALITY, 9);

        float xres, yres;
        unsigned short resunit;
        if (TIFFGetField(in, TIFFTAG_XRESOLUTION, &xres))
            TIFFSetField(out, TIFFTAG_XRESOLUTION, xres);
        if (TIFFGetField(in, TIFFTAG_YRESOLUTION, &yres))
            TIFFSetField(out, TIFFTAG_YRESOLUTION, yres);
        if (TIFFGetField(in, TIFFTAG_RESOLUTIONUNIT, &resunit))
            TIFFSetField(out, TIFFTAG_RESOLUTIONUNIT, resunit);

        void const* icc_data = nullptr;
        unsigned int icc_len = 0;
        if (TIFFGetField(in, TIFFTAG_ICCPROFILE, &icc_len, &icc_data))
            TIFFSetField(out, TIFFTAG_ICCPROFILE, icc_len, icc_data);
    }

    void recompress_file(const std::filesystem::path& input, const std::filesystem::path& output) {
        unique_TIFF in(TIFFOpen(input.string().c_str(), "r"));
        if (!in) {
            throw std::runtime_error("TiffOptimizer: cannot open input");
        }
        unique_TIFF out(TIFFOpen(output.string().c_str(), "w"));
        if (!out) {
            throw std::runtime_error("TiffOptimizer: cannot open output");
        }

        int pages = 0;
        do {
            std::uint32_t width = 0, height = 0;
            TIFFGetField(in.get(), TIFFTAG_IMAGEWIDTH, &width);
            TIFFGetField(in.get(), TIFFTAG_IMAGELENGTH, &height);

            if (width == 0 || height == 0) {
                Logger::log(LogLevel::Debug, "Skipping empty TIFF directory", optimizer_tag());
                continue;
            }
            check_pixel_budget(width, height, "TIFF");
            std::vector<std::uint32_t> raster(static_cast<std::size_t>(width) * static_cast<std::size_t>(height));

            // decodes any photometric/compression combination to ABGR words
            if (!TIFFReadRGBAImageOriented(in.get(), width, height, raster.data(), ORIENTATION_TOPLEFT, 1)) {
                throw std::runtime_error("TiffOptimizer: TIFFReadRGBAImageOriented failed");
            }

            set_output_tags(in.get(), out.get());
            TIFFSetField(out.get(), TIFFTAG_IMAGEWIDTH, width);
            TIFFSetField(out.get(), TIFFTAG_IMAGELENGTH, height);
            TIFFSetField(out.get(), TIFFTAG_SAMPLESPERPIXEL, 4);
            TIFFSetField(out.get(), TIFFTAG_BITSPERSAMPLE, 8);
            TIFFSetField(out.get(), TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_RGB);
            TIFFSetField(out.get(), TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
            TIFFSetField(out.get(), TIFFTAG_ROWSPERSTRIP, TIFFDefaultStripSize(out.get(), 0));

            unsigned short extra_samples = EXTRASAMPLE_UNASSALPHA;
            TIFFSetField(out.get(), TIFFTAG_EXTRASAMPLES, 1, &extra_samples);

            for (std::uint32_t row = 0; row < height; ++row) {
                tdata_t row_data = &raster[static_cast<std::size_t>(row) * width];
                if (TIFFWriteScanline(out.get(), row_data, row, 0) < 0) {
                    throw std::runtime_error("TiffOptimizer: write scanline failed");
                }
            }

            if (!TIFFWriteDirectory(out.get())) {
                throw std::runtime_error("TiffOptimizer: write directory failed");
            }
            ++pages;
        } while (TIFFReadDirectory(in.get()));

        if (pages == 0) {
            throw std::runtime_error("TiffOptimizer: no image data");
        }
    }

} // namespace

std::optional<ByteBuffer> TiffOptimizer::optimize(const ByteView input, const OptimizationOptions&) {
    // libtiff works on seekable files; stage the entry on disk
    const ScopedTempDir work("tiff", optimizer_tag());
    const auto in_path = work.path() / "input.tif";
    const auto out_path = work.path() / "output.tif";

    write_file(in_path, input);
    recompress_file(in_path, out_path);
    return read_file(out_path);
}

} // namespace optipack
