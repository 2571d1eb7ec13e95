#pragma once

#include <QByteArray>
#include <QImage>
#include <QString>

// Row-major interleaved raster, origin top-left. Channel order is RGB or RGBA.
struct ImageBuffer {
    int width = 0;
    int height = 0;
    int channels = 0;   // 3 or 4
    QByteArray data;

    ImageBuffer() = default;
    ImageBuffer(int w, int h, int c);

    bool isValid() const;
    bool hasAlpha() const { return channels == 4; }

    const uchar* pixel(int x, int y) const;
    uchar* pixel(int x, int y);

    QImage toQImage() const;
    static ImageBuffer fromQImage(const QImage& image);
    static ImageBuffer load(const QString& filePath);
};
