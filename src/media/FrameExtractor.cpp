#include "FrameExtractor.h"
#include "VideoDecoder.h"
#include "AppConstants.h"
#include "AssetError.h"
#include "CancellationToken.h"
#include "Log.h"

#include <QDir>
#include <cstring>

// --- DirectoryFrameSink ---

DirectoryFrameSink::DirectoryFrameSink(const QString& directory)
    : m_directory(directory) {}

void DirectoryFrameSink::writeFrame(int64_t index, const QImage& frame) {
    const QString path = framePath(m_directory, index);
    if (!frame.save(path, "PNG")) {
        throw AssetError(AssetErrorKind::IoFailure, QString("Cannot write frame: %1").arg(path));
    }
}

QString DirectoryFrameSink::framePath(const QString& directory, int64_t index) {
    const QString name = QString("%1%2%3")
        .arg(AppConstants::FrameFilePrefix)
        .arg(static_cast<qlonglong>(index), AppConstants::FrameIndexWidth, 10, QChar('0'))
        .arg(AppConstants::FrameFileSuffix);
    return QDir(directory).filePath(name);
}

QString DirectoryFrameSink::framePattern() {
    return QString::asprintf("%s%%0%dd%s", AppConstants::FrameFilePrefix,
                             AppConstants::FrameIndexWidth, AppConstants::FrameFileSuffix);
}

// --- FrameExtractor ---

FrameExtractor::FrameExtractor(const QSize& screenSize, int canvasWidth)
    : m_screenSize(screenSize), m_canvasWidth(canvasWidth) {}

int64_t FrameExtractor::extract(const VideoExportParams& params,
                                const CancellationToken& cancel,
                                FrameSink& sink) {
    if (params.startFrame < 0 || params.endFrame <= params.startFrame) {
        throw AssetError(AssetErrorKind::InvalidInput,
                         QString("Invalid frame range %1-%2").arg(params.startFrame).arg(params.endFrame));
    }

    VideoDecoder decoder;
    if (!decoder.open(params.sourcePath)) {
        throw AssetError(AssetErrorKind::FrameReadFailure,
                         QString("Cannot open video %1: %2").arg(params.sourcePath, decoder.errorString()));
    }

    const VideoInfo& info = decoder.info();
    const QRect bounds(0, 0, info.width, info.height);
    if (params.cropBox.isEmpty() || !bounds.contains(params.cropBox)) {
        throw AssetError(AssetErrorKind::InvalidInput,
                         QString("Crop box (%1, %2, %3x%4) outside frame %5x%6")
                             .arg(params.cropBox.x()).arg(params.cropBox.y())
                             .arg(params.cropBox.width()).arg(params.cropBox.height())
                             .arg(info.width).arg(info.height));
    }

    const int64_t requested = params.frameCount();
    EPA_LOG_DEBUG("Extracting frames {}-{} from {} ({}x{} @ {:.3f} fps)",
                  params.startFrame, params.endFrame, qUtf8Printable(params.sourcePath),
                  info.width, info.height, info.fps);

    if (!decoder.seekToFrame(params.startFrame)) {
        EPA_LOG_WARN("Start frame {} is past the end of {}", params.startFrame,
                     qUtf8Printable(params.sourcePath));
        return 0;
    }

    int64_t produced = 0;
    for (int64_t i = 0; i < requested; ++i) {
        if (cancel.isCancelled())
            throw AssetError(AssetErrorKind::Cancelled, "Export cancelled");

        QImage frame = decoder.decodeNextFrame();
        if (frame.isNull()) {
            EPA_LOG_WARN("Frame read stopped at {} of {}, output truncated", i, requested);
            break;
        }

        sink.writeFrame(i, transformFrame(frame, params.cropBox));
        ++produced;
    }
    return produced;
}

QImage FrameExtractor::transformFrame(const QImage& frame, const QRect& cropBox) const {
    if (!frame.rect().contains(cropBox) || cropBox.isEmpty()) {
        throw AssetError(AssetErrorKind::InvalidInput, "Crop box outside frame");
    }

    QImage out = frame.copy(cropBox)
                     .mirrored(true, true)
                     .scaled(m_screenSize, Qt::IgnoreAspectRatio, Qt::SmoothTransformation)
                     .convertToFormat(QImage::Format_RGB32);

    const int padding = m_canvasWidth - out.width();
    if (padding <= 0) return out;

    QImage canvas(m_canvasWidth, m_screenSize.height(), QImage::Format_RGB32);
    canvas.fill(qRgb(0, 0, 0));
    const int rowBytes = out.width() * 4;
    for (int y = 0; y < out.height(); ++y) {
        uchar* dst = canvas.scanLine(y) + padding * 4;
        std::memcpy(dst, out.constScanLine(y), rowBytes);
    }
    return canvas;
}
