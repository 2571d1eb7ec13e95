#include "PixelCodec.h"
#include "AssetError.h"
#include "Log.h"

#include <array>
#include <cmath>

namespace {

constexpr std::array<std::pair<int, int>, 8> CommonSizes = {{
    {256, 256},
    {512, 512},
    {128, 128},
    {512, 128},
    {256, 512},
    {360, 640},
    {480, 854},
    {720, 1280},
}};

} // namespace

namespace PixelCodec {

QByteArray encode(const ImageBuffer& image, PackLayout layout) {
    if (!image.isValid()) {
        throw AssetError(AssetErrorKind::InvalidInput,
                         QString("Invalid image buffer %1x%2x%3 (%4 bytes)")
                             .arg(image.width).arg(image.height).arg(image.channels)
                             .arg(image.data.size()));
    }

    const int w = image.width;
    const int h = image.height;
    const bool logo = layout == PackLayout::Logo;

    QByteArray out(static_cast<qsizetype>(w) * h * 4, '\0');
    uchar* dst = reinterpret_cast<uchar*>(out.data());

    for (int y = 0; y < h; ++y) {
        // 180 degree rotation maps output row y to source row h-1-y.
        // The logo layout reverses the rows once more, landing back on source row y.
        const int srcY = logo ? y : h - 1 - y;
        for (int x = 0; x < w; ++x) {
            const uchar* src = image.pixel(w - 1 - x, srcY);
            dst[0] = src[2];
            dst[1] = src[1];
            dst[2] = src[0];
            dst[3] = (image.hasAlpha() && !logo) ? src[3] : 255;
            dst += 4;
        }
    }
    return out;
}

ImageBuffer decode(const QByteArray& data, int width, int height) {
    const qsizetype expected = static_cast<qsizetype>(width) * height * 4;
    if (width <= 0 || height <= 0 || data.size() != expected) {
        EPA_LOG_WARN("Packed image size mismatch: {} bytes, expected {} for {}x{}; detecting size",
                     data.size(), expected, width, height);
        std::optional<QSize> detected = detectDimensions(data.size());
        if (!detected) {
            throw AssetError(AssetErrorKind::UnknownDimensions,
                             QString("Cannot determine image dimensions for %1 bytes").arg(data.size()));
        }
        width = detected->width();
        height = detected->height();
        EPA_LOG_INFO("Detected packed image size {}x{}", width, height);
    }

    ImageBuffer image(width, height, 4);
    const uchar* src = reinterpret_cast<const uchar*>(data.constData());
    uchar* dst = reinterpret_cast<uchar*>(image.data.data());
    const qsizetype pixels = static_cast<qsizetype>(width) * height;
    for (qsizetype i = 0; i < pixels; ++i) {
        dst[0] = src[1];
        dst[1] = src[2];
        dst[2] = src[3];
        dst[3] = src[0];
        src += 4;
        dst += 4;
    }
    return image;
}

std::optional<QSize> detectDimensions(qsizetype byteCount) {
    if (byteCount <= 0 || byteCount % 4 != 0) return std::nullopt;

    const qsizetype pixelCount = byteCount / 4;
    for (const auto& size : CommonSizes) {
        if (static_cast<qsizetype>(size.first) * size.second == pixelCount)
            return QSize(size.first, size.second);
    }

    const auto side = static_cast<qsizetype>(std::llround(std::sqrt(static_cast<double>(pixelCount))));
    if (side * side == pixelCount)
        return QSize(static_cast<int>(side), static_cast<int>(side));

    return std::nullopt;
}

} // namespace PixelCodec
