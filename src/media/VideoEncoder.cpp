#include "VideoEncoder.h"
#include "AppConstants.h"
#include "FrameExtractor.h"
#include "AssetError.h"
#include "Log.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

namespace {

#ifdef Q_OS_WIN
constexpr const char* EncoderExecutable = "ffmpeg.exe";
#else
constexpr const char* EncoderExecutable = "ffmpeg";
#endif

bool isExecutableFile(const QString& path) {
    QFileInfo fi(path);
    return fi.exists() && fi.isFile();
}

} // namespace

VideoEncoder::VideoEncoder(const EncoderSettings& settings)
    : m_settings(settings) {}

QStringList VideoEncoder::buildArguments(const QString& frameDir, double fps,
                                         const QString& outputPath) const {
    QStringList arguments;
    arguments << "-framerate" << QString::number(fps)
              << "-i" << QDir(frameDir).filePath(DirectoryFrameSink::framePattern())
              << "-vf" << QString("format=%1").arg(m_settings.pixelFormat)
              << "-c:v" << m_settings.videoCodec
              << "-b:v" << m_settings.videoBitrate
              << "-an"
              << "-y"
              << outputPath;
    return arguments;
}

void VideoEncoder::encode(const QString& frameDir, double fps, const QString& outputPath) {
    if (m_settings.encoderPath.isEmpty()) {
        throw AssetError(AssetErrorKind::EncoderUnavailable, "No video encoder configured");
    }

    const QStringList arguments = buildArguments(frameDir, fps, outputPath);
    EPA_LOG_INFO("Running encoder: {} {}", qUtf8Printable(m_settings.encoderPath),
                 qUtf8Printable(arguments.join(' ')));

    QProcess ffmpeg;
    ffmpeg.start(m_settings.encoderPath, arguments);
    if (!ffmpeg.waitForStarted(-1)) {
        throw AssetError(AssetErrorKind::EncoderUnavailable,
                         QString("Cannot start encoder %1: %2")
                             .arg(m_settings.encoderPath, ffmpeg.errorString()));
    }
    ffmpeg.waitForFinished(-1);

    const QString stderrText = QString::fromUtf8(ffmpeg.readAllStandardError());
    if (ffmpeg.exitStatus() != QProcess::NormalExit || ffmpeg.exitCode() != 0) {
        EPA_LOG_ERROR("Encoder exited with code {}: {}", ffmpeg.exitCode(), qUtf8Printable(stderrText));
        throw AssetError(AssetErrorKind::EncodeFailed,
                         QString("Encoding failed: %1").arg(stderrText.left(AppConstants::EncoderStderrExcerpt)));
    }

    EPA_LOG_INFO("Encoded {}", qUtf8Printable(outputPath));
}

QString VideoEncoder::locate(const QString& configuredPath) {
    if (!configuredPath.isEmpty()) {
        if (isExecutableFile(configuredPath))
            return QFileInfo(configuredPath).absoluteFilePath();
        EPA_LOG_WARN("Configured encoder not found: {}", qUtf8Printable(configuredPath));
    }

    if (QCoreApplication::instance()) {
        const QString appLocal = QDir(QCoreApplication::applicationDirPath()).filePath(EncoderExecutable);
        if (isExecutableFile(appLocal)) {
            EPA_LOG_INFO("Found encoder next to executable: {}", qUtf8Printable(appLocal));
            return appLocal;
        }
    }

    const QString cwdLocal = QDir::current().filePath(EncoderExecutable);
    if (isExecutableFile(cwdLocal)) {
        EPA_LOG_INFO("Found encoder in working directory: {}", qUtf8Printable(cwdLocal));
        return QFileInfo(cwdLocal).absoluteFilePath();
    }

    const QString onPath = QStandardPaths::findExecutable("ffmpeg");
    if (!onPath.isEmpty()) {
        EPA_LOG_INFO("Found system encoder: {}", qUtf8Printable(onPath));
        return onPath;
    }

    EPA_LOG_WARN("No ffmpeg executable found");
    return QString();
}
