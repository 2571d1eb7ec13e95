#pragma once

#include <QByteArray>
#include <QSize>
#include <optional>
#include "ImageBuffer.h"

// Packed client image format (*.argb): width * height * 4 bytes, no header.
//
// Export direction writes each pixel as B,G,R,A after rotating the image 180 degrees.
// The legacy decode direction reads A,R,G,B. The two orders are not mirror images of
// each other; the legacy files on disk really are stored that way.
namespace PixelCodec {

enum class PackLayout {
    Standard,   // overlay, display: rotate 180
    Logo        // rotate 180, then reverse rows again; alpha forced to 255
};

QByteArray encode(const ImageBuffer& image, PackLayout layout = PackLayout::Standard);

// Decodes A,R,G,B tuples into an RGBA buffer. When width*height*4 does not match the
// data size the dimensions are guessed with detectDimensions().
// Throws AssetError(UnknownDimensions) when no size fits.
ImageBuffer decode(const QByteArray& data, int width, int height);

std::optional<QSize> detectDimensions(qsizetype byteCount);

} // namespace PixelCodec
