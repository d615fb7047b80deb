// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.


#include "core/image_decoder.hpp"

#include "core/logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <csetjmp>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>

#include <itkImageRegionConstIterator.h>
#include <itkImageRegionIterator.h>

#include <jerror.h>
#include <jpeglib.h>
#include <png.h>

namespace med_classifier::core {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ImageDecoder");
    return logger;
}

constexpr std::size_t kErrorBufferSize = 256;

/// Interleaved 8-bit samples with one (gray) or three (RGB) channels
struct RasterBuffer {
    int width = 0;
    int height = 0;
    unsigned int channels = 0;
    unsigned int nativeComponents = 0;
    std::vector<std::uint8_t> samples;
};

std::string lowercaseExtension(std::string_view fileName) {
    std::string extension = std::filesystem::path(fileName).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

bool startsWith(std::span<const std::uint8_t> bytes,
                std::initializer_list<std::uint8_t> magic) {
    if (bytes.size() < magic.size()) {
        return false;
    }
    return std::equal(magic.begin(), magic.end(), bytes.begin());
}

std::string colorModeFor(unsigned int components) {
    switch (components) {
        case 1: return "L";
        case 2: return "LA";
        case 3: return "RGB";
        case 4: return "RGBA";
        default: return "RGB";
    }
}

// ============================================================================
// PNG (libpng, memory source)
// ============================================================================

struct PngMemorySource {
    std::span<const std::uint8_t> bytes;
    std::size_t offset = 0;
};

void pngReadFromMemory(png_structp png, png_bytep out, png_size_t length) {
    auto* source = static_cast<PngMemorySource*>(png_get_io_ptr(png));
    if (length > source->bytes.size() - source->offset) {
        png_error(png, "unexpected end of PNG data");
    }
    std::memcpy(out, source->bytes.data() + source->offset, length);
    source->offset += length;
}

void pngErrorExit(png_structp png, png_const_charp message) {
    auto* buffer = static_cast<char*>(png_get_error_ptr(png));
    std::snprintf(buffer, kErrorBufferSize, "%s", message);
    png_longjmp(png, 1);
}

void pngWarning(png_structp, png_const_charp) {}

unsigned int pngNativeComponents(png_structp png, png_infop info, int colorType) {
    switch (colorType) {
        case PNG_COLOR_TYPE_GRAY: return 1;
        case PNG_COLOR_TYPE_GRAY_ALPHA: return 2;
        case PNG_COLOR_TYPE_RGB_ALPHA: return 4;
        case PNG_COLOR_TYPE_PALETTE:
            return png_get_valid(png, info, PNG_INFO_tRNS) ? 4 : 3;
        default: return 3;
    }
}

/// Palette and low bit depths expand to 8 bits, 16 bits scale down, alpha is stripped
bool readPng(std::span<const std::uint8_t> bytes, RasterBuffer& raster, char* error) {
    PngMemorySource source{bytes, 0};

    png_structp png = png_create_read_struct(
        PNG_LIBPNG_VER_STRING, error, pngErrorExit, pngWarning);
    if (!png) {
        std::snprintf(error, kErrorBufferSize, "png_create_read_struct failed");
        return false;
    }
    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_read_struct(&png, nullptr, nullptr);
        std::snprintf(error, kErrorBufferSize, "png_create_info_struct failed");
        return false;
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_read_struct(&png, &info, nullptr);
        return false;
    }

    png_set_read_fn(png, &source, pngReadFromMemory);
    png_read_info(png, info);

    const int colorType = png_get_color_type(png, info);
    const int bitDepth = png_get_bit_depth(png, info);
    raster.nativeComponents = pngNativeComponents(png, info, colorType);

    if (colorType == PNG_COLOR_TYPE_PALETTE) {
        png_set_palette_to_rgb(png);
    }
    if (colorType == PNG_COLOR_TYPE_GRAY && bitDepth < 8) {
        png_set_expand_gray_1_2_4_to_8(png);
    }
    if (bitDepth == 16) {
        png_set_scale_16(png);
    }
    if (colorType & PNG_COLOR_MASK_ALPHA) {
        png_set_strip_alpha(png);
    }
    const int passes = png_set_interlace_handling(png);
    png_read_update_info(png, info);

    raster.width = static_cast<int>(png_get_image_width(png, info));
    raster.height = static_cast<int>(png_get_image_height(png, info));
    raster.channels = png_get_channels(png, info);
    const auto rowBytes = png_get_rowbytes(png, info);
    raster.samples.assign(rowBytes * static_cast<std::size_t>(raster.height), 0);

    for (int pass = 0; pass < passes; ++pass) {
        for (int y = 0; y < raster.height; ++y) {
            png_read_row(png, raster.samples.data() + static_cast<std::size_t>(y) * rowBytes,
                         nullptr);
        }
    }
    png_read_end(png, nullptr);
    png_destroy_read_struct(&png, &info, nullptr);
    return true;
}

// ============================================================================
// JPEG (libjpeg, memory source)
// ============================================================================

struct JpegErrorHandler {
    jpeg_error_mgr pub;  // must be first
    jmp_buf setjmpBuffer;
    char message[JMSG_LENGTH_MAX];
};

void jpegErrorExit(j_common_ptr cinfo) {
    auto* handler = reinterpret_cast<JpegErrorHandler*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, handler->message);
    std::longjmp(handler->setjmpBuffer, 1);
}

void jpegOutputMessage(j_common_ptr) {}

class JpegDecompressor {
public:
    JpegDecompressor() {
        cinfo_.err = jpeg_std_error(&handler_.pub);
        handler_.pub.error_exit = jpegErrorExit;
        handler_.pub.output_message = jpegOutputMessage;
        jpeg_create_decompress(&cinfo_);
    }

    ~JpegDecompressor() {
        jpeg_destroy_decompress(&cinfo_);
    }

    JpegDecompressor(const JpegDecompressor&) = delete;
    JpegDecompressor& operator=(const JpegDecompressor&) = delete;

    jpeg_decompress_struct* operator->() { return &cinfo_; }
    jpeg_decompress_struct& get() { return cinfo_; }
    JpegErrorHandler& handler() { return handler_; }

private:
    jpeg_decompress_struct cinfo_{};
    JpegErrorHandler handler_{};
};

bool readJpeg(std::span<const std::uint8_t> bytes, RasterBuffer& raster, char* error) {
    JpegDecompressor decompressor;

    if (setjmp(decompressor.handler().setjmpBuffer)) {
        std::snprintf(error, kErrorBufferSize, "%s", decompressor.handler().message);
        return false;
    }

    // Some libjpeg builds declare a non-const buffer; the data is only read
    jpeg_mem_src(&decompressor.get(),
                 const_cast<unsigned char*>(bytes.data()),
                 static_cast<unsigned long>(bytes.size()));

    if (jpeg_read_header(&decompressor.get(), TRUE) != JPEG_HEADER_OK) {
        std::snprintf(error, kErrorBufferSize, "missing JPEG header");
        return false;
    }

    raster.nativeComponents = static_cast<unsigned int>(decompressor->num_components);
    decompressor->out_color_space =
        decompressor->num_components == 1 ? JCS_GRAYSCALE : JCS_RGB;

    jpeg_start_decompress(&decompressor.get());

    raster.width = static_cast<int>(decompressor->output_width);
    raster.height = static_cast<int>(decompressor->output_height);
    raster.channels = static_cast<unsigned int>(decompressor->output_components);
    const auto rowStride = static_cast<std::size_t>(decompressor->output_width) * raster.channels;
    raster.samples.assign(rowStride * decompressor->output_height, 0);

    while (decompressor->output_scanline < decompressor->output_height) {
        JSAMPROW row = raster.samples.data() + decompressor->output_scanline * rowStride;
        jpeg_read_scanlines(&decompressor.get(), &row, 1);
    }
    jpeg_finish_decompress(&decompressor.get());
    return true;
}

// ============================================================================
// BMP (uncompressed, bottom-up or top-down)
// ============================================================================

std::uint32_t readLe32(std::span<const std::uint8_t> bytes, std::size_t offset) {
    return static_cast<std::uint32_t>(bytes[offset])
        | (static_cast<std::uint32_t>(bytes[offset + 1]) << 8)
        | (static_cast<std::uint32_t>(bytes[offset + 2]) << 16)
        | (static_cast<std::uint32_t>(bytes[offset + 3]) << 24);
}

std::uint16_t readLe16(std::span<const std::uint8_t> bytes, std::size_t offset) {
    return static_cast<std::uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
}

/// Supports BI_RGB with 8 (palette), 24 and 32 bits per pixel
bool readBmp(std::span<const std::uint8_t> bytes, RasterBuffer& raster, char* error) {
    constexpr std::size_t kFileHeaderSize = 14;
    constexpr std::size_t kInfoHeaderSize = 40;
    if (bytes.size() < kFileHeaderSize + kInfoHeaderSize) {
        std::snprintf(error, kErrorBufferSize, "truncated BMP header");
        return false;
    }

    const auto dataOffset = readLe32(bytes, 10);
    const auto headerSize = readLe32(bytes, kFileHeaderSize);
    const auto width = static_cast<std::int32_t>(readLe32(bytes, 18));
    const auto rawHeight = static_cast<std::int32_t>(readLe32(bytes, 22));
    const auto bitCount = readLe16(bytes, 28);
    const auto compression = readLe32(bytes, 30);
    const auto colorsUsed = readLe32(bytes, 46);

    if (headerSize < kInfoHeaderSize || compression != 0
        || (bitCount != 8 && bitCount != 24 && bitCount != 32)) {
        std::snprintf(error, kErrorBufferSize, "unsupported BMP layout (%u bpp, compression %u)",
                      static_cast<unsigned>(bitCount), static_cast<unsigned>(compression));
        return false;
    }
    if (width <= 0 || rawHeight == 0 || rawHeight == INT32_MIN) {
        std::snprintf(error, kErrorBufferSize, "invalid BMP dimensions");
        return false;
    }

    const bool topDown = rawHeight < 0;
    const auto height = topDown ? -rawHeight : rawHeight;
    const std::size_t rowStride =
        ((static_cast<std::size_t>(width) * bitCount + 31) / 32) * 4;
    if (dataOffset > bytes.size()
        || rowStride * static_cast<std::size_t>(height) > bytes.size() - dataOffset) {
        std::snprintf(error, kErrorBufferSize, "BMP pixel data is truncated");
        return false;
    }

    std::vector<std::array<std::uint8_t, 3>> palette;
    if (bitCount == 8) {
        const std::size_t entries = colorsUsed == 0 ? 256 : std::min<std::size_t>(colorsUsed, 256);
        const std::size_t paletteOffset = kFileHeaderSize + headerSize;
        if (paletteOffset + entries * 4 > bytes.size()) {
            std::snprintf(error, kErrorBufferSize, "BMP palette is truncated");
            return false;
        }
        palette.resize(entries);
        bool grayPalette = true;
        for (std::size_t i = 0; i < entries; ++i) {
            const auto* entry = bytes.data() + paletteOffset + i * 4;
            palette[i] = {entry[2], entry[1], entry[0]};
            grayPalette = grayPalette && entry[0] == entry[1] && entry[1] == entry[2];
        }
        raster.nativeComponents = grayPalette ? 1 : 3;
    } else {
        raster.nativeComponents = bitCount == 32 ? 4 : 3;
    }

    raster.width = width;
    raster.height = height;
    raster.channels = 3;
    raster.samples.assign(static_cast<std::size_t>(width) * height * 3, 0);

    for (int y = 0; y < height; ++y) {
        const int sourceRow = topDown ? y : height - 1 - y;
        const auto* row = bytes.data() + dataOffset + static_cast<std::size_t>(sourceRow) * rowStride;
        auto* out = raster.samples.data() + static_cast<std::size_t>(y) * width * 3;
        for (int x = 0; x < width; ++x, out += 3) {
            if (bitCount == 8) {
                const std::size_t index = row[x];
                if (index >= palette.size()) {
                    std::snprintf(error, kErrorBufferSize, "BMP palette index %zu out of range", index);
                    return false;
                }
                std::copy(palette[index].begin(), palette[index].end(), out);
            } else {
                const auto* pixel = row + static_cast<std::size_t>(x) * (bitCount / 8);
                out[0] = pixel[2];
                out[1] = pixel[1];
                out[2] = pixel[0];
            }
        }
    }
    return true;
}

RgbImageType::Pointer toRgbImage(const RasterBuffer& raster) {
    auto image = RgbImageType::New();
    RgbImageType::RegionType region;
    region.SetSize(0, static_cast<itk::SizeValueType>(raster.width));
    region.SetSize(1, static_cast<itk::SizeValueType>(raster.height));
    image->SetRegions(region);
    image->Allocate();

    // Region iteration is row-major with x fastest, matching the raster layout
    const auto* sample = raster.samples.data();
    itk::ImageRegionIterator<RgbImageType> it(image, region);
    for (it.GoToBegin(); !it.IsAtEnd(); ++it, sample += raster.channels) {
        RgbPixelType pixel;
        if (raster.channels == 1) {
            pixel.Fill(static_cast<float>(sample[0]));
        } else {
            pixel.Set(static_cast<float>(sample[0]),
                      static_cast<float>(sample[1]),
                      static_cast<float>(sample[2]));
        }
        it.Set(pixel);
    }
    return image;
}

}  // anonymous namespace

ChannelPlanes ChannelPlanes::fromImage(const RgbImageType& image) {
    ChannelPlanes planes;
    auto size = image.GetLargestPossibleRegion().GetSize();
    planes.width = static_cast<int>(size[0]);
    planes.height = static_cast<int>(size[1]);

    auto count = static_cast<std::size_t>(planes.width) * static_cast<std::size_t>(planes.height);
    planes.red.reserve(count);
    planes.green.reserve(count);
    planes.blue.reserve(count);

    itk::ImageRegionConstIterator<RgbImageType> it(&image, image.GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        const auto& pixel = it.Get();
        planes.red.push_back(pixel.GetRed());
        planes.green.push_back(pixel.GetGreen());
        planes.blue.push_back(pixel.GetBlue());
    }
    return planes;
}

std::vector<float> ChannelPlanes::gray() const {
    std::vector<float> values(pixelCount());
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = (red[i] + green[i] + blue[i]) / 3.0f;
    }
    return values;
}

std::vector<float> ChannelPlanes::luminance() const {
    std::vector<float> values(pixelCount());
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = 0.299f * red[i] + 0.587f * green[i] + 0.114f * blue[i];
    }
    return values;
}

std::string ImageDecoder::detectFormat(std::span<const std::uint8_t> bytes,
                                       std::string_view fileName) {
    if (startsWith(bytes, {0x89, 'P', 'N', 'G'})) return "PNG";
    if (startsWith(bytes, {0xFF, 0xD8, 0xFF})) return "JPEG";
    if (startsWith(bytes, {'B', 'M'})) return "BMP";
    if (startsWith(bytes, {'I', 'I', 0x2A, 0x00})
        || startsWith(bytes, {'M', 'M', 0x00, 0x2A})) {
        return "TIFF";
    }

    auto extension = lowercaseExtension(fileName);
    if (extension == ".png") return "PNG";
    if (extension == ".jpg" || extension == ".jpeg") return "JPEG";
    if (extension == ".bmp") return "BMP";
    if (extension == ".tif" || extension == ".tiff") return "TIFF";
    return "";
}

std::expected<DecodedImage, DecodeError>
ImageDecoder::decode(std::span<const std::uint8_t> bytes, std::string_view fileName) {
    if (bytes.empty()) {
        return std::unexpected(DecodeError{
            DecodeError::Code::EmptyInput,
            "No image data for " + std::string(fileName)
        });
    }

    auto format = detectFormat(bytes, fileName);
    if (format.empty() || format == "TIFF") {
        return std::unexpected(DecodeError{
            DecodeError::Code::UnsupportedFormat,
            (format.empty() ? "Unrecognized image container for " : "No TIFF reader for ")
                + std::string(fileName)
        });
    }

    RasterBuffer raster;
    char error[kErrorBufferSize] = {};
    bool ok = false;
    if (format == "PNG") {
        ok = readPng(bytes, raster, error);
    } else if (format == "JPEG") {
        ok = readJpeg(bytes, raster, error);
    } else {
        ok = readBmp(bytes, raster, error);
    }

    if (!ok) {
        getLogger()->warn("Failed to decode {} as {}: {}", fileName, format, error);
        return std::unexpected(DecodeError{
            DecodeError::Code::DecodingFailed,
            format + ": " + error
        });
    }

    if (raster.width <= 0 || raster.height <= 0
        || (raster.channels != 1 && raster.channels != 3)) {
        return std::unexpected(DecodeError{
            DecodeError::Code::InvalidDimensions,
            std::to_string(raster.width) + "x" + std::to_string(raster.height)
                + " with " + std::to_string(raster.channels) + " channels"
        });
    }

    DecodedImage decoded;
    decoded.format = format;
    decoded.width = raster.width;
    decoded.height = raster.height;
    decoded.nativeComponents = raster.nativeComponents;
    decoded.colorMode = colorModeFor(raster.nativeComponents);
    decoded.image = toRgbImage(raster);

    getLogger()->debug("Decoded {} as {} {}x{} ({})", fileName, decoded.format,
                       decoded.width, decoded.height, decoded.colorMode);
    return decoded;
}

}  // namespace med_classifier::core
