#pragma once

#include <QString>
#include <QStringList>

struct EncoderSettings {
    QString encoderPath;            // ffmpeg executable
    QString videoCodec = "libx264";
    QString videoBitrate = "600k";
    QString pixelFormat = "nv12";
};

// Runs the external ffmpeg binary over a numbered PNG sequence. The call blocks
// until the process exits; it is never interrupted part way.
class VideoEncoder {
public:
    explicit VideoEncoder(const EncoderSettings& settings);

    // Throws AssetError: EncoderUnavailable when the process cannot start,
    // EncodeFailed with the first part of stderr on a non-zero exit.
    void encode(const QString& frameDir, double fps, const QString& outputPath);

    QStringList buildArguments(const QString& frameDir, double fps, const QString& outputPath) const;

    // Resolves the encoder executable: configured path, next to the application,
    // the working directory, then PATH. Empty when none is found.
    static QString locate(const QString& configuredPath = QString());

private:
    EncoderSettings m_settings;
};
