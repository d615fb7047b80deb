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

/**
 * @file image_decoder.hpp
 * @brief Decodes raster image bytes (PNG, JPEG, BMP) into an RGB ITK image
 * @details The container is detected from magic bytes, falling back to the
 *          file name extension. Decoding reads only the input buffer. Pixels
 *          are normalized to a 0-255 float scale and alpha is dropped; the
 *          native channel layout is recorded so callers can tell a
 *          single-channel source from an RGB one. TIFF is recognized but
 *          reported as unsupported.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <itkImage.h>
#include <itkRGBPixel.h>

namespace med_classifier::core {

using RgbPixelType = itk::RGBPixel<float>;
using RgbImageType = itk::Image<RgbPixelType, 2>;

/**
 * @brief Error information for image decoding
 */
struct DecodeError {
    enum class Code {
        Success,
        EmptyInput,
        UnsupportedFormat,
        InvalidDimensions,
        DecodingFailed
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::EmptyInput: return "Empty input: " + message;
            case Code::UnsupportedFormat: return "Unsupported format: " + message;
            case Code::InvalidDimensions: return "Invalid dimensions: " + message;
            case Code::DecodingFailed: return "Decoding failed: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief A decoded raster image and its native layout
 */
struct DecodedImage {
    RgbImageType::Pointer image;
    int width = 0;
    int height = 0;
    unsigned int nativeComponents = 3;
    std::string colorMode;  ///< "L", "LA", "RGB", "RGBA"
    std::string format;     ///< "PNG", "JPEG", "BMP", "TIFF"

    /// Native single-channel data (with or without alpha)
    [[nodiscard]] bool isNativeGrayscale() const noexcept {
        return nativeComponents <= 2;
    }
};

/**
 * @brief Row-major float planes of an RGB image on a 0-255 scale
 */
struct ChannelPlanes {
    int width = 0;
    int height = 0;
    std::vector<float> red;
    std::vector<float> green;
    std::vector<float> blue;

    [[nodiscard]] static ChannelPlanes fromImage(const RgbImageType& image);

    [[nodiscard]] std::size_t pixelCount() const noexcept { return red.size(); }

    [[nodiscard]] std::size_t index(int x, int y) const noexcept {
        return static_cast<std::size_t>(y) * static_cast<std::size_t>(width)
            + static_cast<std::size_t>(x);
    }

    /// Mean of the three channels at (x, y)
    [[nodiscard]] float meanAt(int x, int y) const noexcept {
        auto i = index(x, y);
        return (red[i] + green[i] + blue[i]) / 3.0f;
    }

    /// Per-pixel mean of the three channels
    [[nodiscard]] std::vector<float> gray() const;

    /// Per-pixel 0.299 R + 0.587 G + 0.114 B
    [[nodiscard]] std::vector<float> luminance() const;
};

/**
 * @brief Stateless in-memory raster decoder
 *
 * PNG goes through libpng with a memory read callback, JPEG through libjpeg's
 * memory source, and uncompressed BMP is parsed directly. The result is an
 * ITK RGB image regardless of the source layout.
 *
 * @example
 * @code
 * auto decoded = ImageDecoder::decode(bytes, "scan.png");
 * if (decoded) {
 *     auto planes = ChannelPlanes::fromImage(*decoded->image);
 * }
 * @endcode
 */
class ImageDecoder {
public:
    [[nodiscard]] static std::expected<DecodedImage, DecodeError>
    decode(std::span<const std::uint8_t> bytes, std::string_view fileName);

    /**
     * @brief Detect the container format
     * @return "PNG", "JPEG", "BMP", "TIFF" or an empty string
     */
    [[nodiscard]] static std::string
    detectFormat(std::span<const std::uint8_t> bytes, std::string_view fileName);
};

}  // namespace med_classifier::core
