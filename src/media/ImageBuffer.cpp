#include "ImageBuffer.h"
#include <cstring>

ImageBuffer::ImageBuffer(int w, int h, int c)
    : width(w), height(h), channels(c)
    , data(static_cast<qsizetype>(w) * h * c, '\0')
{}

bool ImageBuffer::isValid() const {
    if (width <= 0 || height <= 0) return false;
    if (channels != 3 && channels != 4) return false;
    return data.size() == static_cast<qsizetype>(width) * height * channels;
}

const uchar* ImageBuffer::pixel(int x, int y) const {
    const auto offset = (static_cast<qsizetype>(y) * width + x) * channels;
    return reinterpret_cast<const uchar*>(data.constData()) + offset;
}

uchar* ImageBuffer::pixel(int x, int y) {
    const auto offset = (static_cast<qsizetype>(y) * width + x) * channels;
    return reinterpret_cast<uchar*>(data.data()) + offset;
}

QImage ImageBuffer::toQImage() const {
    if (!isValid()) return QImage();

    const QImage::Format format = hasAlpha() ? QImage::Format_RGBA8888 : QImage::Format_RGB888;
    QImage image(width, height, format);
    const int rowBytes = width * channels;
    for (int y = 0; y < height; ++y) {
        std::memcpy(image.scanLine(y), data.constData() + static_cast<qsizetype>(y) * rowBytes, rowBytes);
    }
    return image;
}

ImageBuffer ImageBuffer::fromQImage(const QImage& image) {
    if (image.isNull()) return ImageBuffer();

    const bool alpha = image.hasAlphaChannel();
    const QImage converted = image.convertToFormat(alpha ? QImage::Format_RGBA8888
                                                         : QImage::Format_RGB888);
    ImageBuffer buffer(converted.width(), converted.height(), alpha ? 4 : 3);
    const int rowBytes = buffer.width * buffer.channels;
    for (int y = 0; y < buffer.height; ++y) {
        std::memcpy(buffer.data.data() + static_cast<qsizetype>(y) * rowBytes,
                    converted.constScanLine(y), rowBytes);
    }
    return buffer;
}

ImageBuffer ImageBuffer::load(const QString& filePath) {
    QImage image(filePath);
    return fromQImage(image);
}
