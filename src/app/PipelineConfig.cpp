#include "PipelineConfig.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

namespace {

QString levelToString(spdlog::level::level_enum level) {
    const auto name = spdlog::level::to_string_view(level);
    return QString::fromUtf8(name.data(), static_cast<int>(name.size()));
}

} // namespace

bool PipelineConfig::load(const QString& filePath) {
    m_error.clear();

    QFile file(filePath);
    if (!file.exists()) {
        EPA_LOG_DEBUG("No config file at {}, using defaults", qUtf8Printable(filePath));
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(filePath);
        EPA_LOG_WARN("{}", qUtf8Printable(m_error));
        return false;
    }

    QJsonParseError parseError;
    auto doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        m_error = QString("Invalid config format in %1: %2").arg(filePath, parseError.errorString());
        EPA_LOG_WARN("{}", qUtf8Printable(m_error));
        return false;
    }

    applyJson(doc.object());
    EPA_LOG_INFO("Loaded config {}", qUtf8Printable(filePath));
    return true;
}

bool PipelineConfig::save(const QString& filePath) const {
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        EPA_LOG_ERROR("Cannot write to: {}", qUtf8Printable(filePath));
        return false;
    }
    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        EPA_LOG_ERROR("Cannot write to: {} ({})", qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return false;
    }
    return true;
}

QJsonObject PipelineConfig::toJson() const {
    const EncoderSettings& enc = exportSettings.encoder;

    QJsonObject encoder;
    encoder["path"] = enc.encoderPath;
    encoder["codec"] = enc.videoCodec;
    encoder["bitrate"] = enc.videoBitrate;
    encoder["pixelFormat"] = enc.pixelFormat;

    QJsonObject screen;
    screen["width"] = exportSettings.screenSize.width();
    screen["height"] = exportSettings.screenSize.height();

    QJsonObject video;
    video["canvasWidth"] = exportSettings.videoCanvasWidth;

    QJsonObject logo;
    logo["width"] = logoSize.width();
    logo["height"] = logoSize.height();

    QJsonObject logObj;
    logObj["dir"] = log.directory;
    logObj["prefix"] = log.prefix;
    logObj["level"] = levelToString(log.level);
    logObj["console"] = log.console;

    QJsonObject root;
    root["encoder"] = encoder;
    root["screen"] = screen;
    root["video"] = video;
    root["logo"] = logo;
    root["log"] = logObj;
    return root;
}

void PipelineConfig::applyJson(const QJsonObject& root) {
    EncoderSettings& enc = exportSettings.encoder;

    const QJsonObject encoder = root["encoder"].toObject();
    enc.encoderPath = encoder["path"].toString(enc.encoderPath);
    enc.videoCodec = encoder["codec"].toString(enc.videoCodec);
    enc.videoBitrate = encoder["bitrate"].toString(enc.videoBitrate);
    enc.pixelFormat = encoder["pixelFormat"].toString(enc.pixelFormat);

    const QJsonObject screen = root["screen"].toObject();
    exportSettings.screenSize = QSize(screen["width"].toInt(exportSettings.screenSize.width()),
                                      screen["height"].toInt(exportSettings.screenSize.height()));

    const QJsonObject video = root["video"].toObject();
    exportSettings.videoCanvasWidth = video["canvasWidth"].toInt(exportSettings.videoCanvasWidth);

    const QJsonObject logo = root["logo"].toObject();
    logoSize = QSize(logo["width"].toInt(logoSize.width()), logo["height"].toInt(logoSize.height()));

    const QJsonObject logObj = root["log"].toObject();
    log.directory = logObj["dir"].toString(log.directory);
    log.prefix = logObj["prefix"].toString(log.prefix);
    if (logObj.contains("level"))
        log.level = Log::levelFromString(logObj["level"].toString());
    log.console = logObj["console"].toBool(log.console);

    // The canvas never crops the screen width
    if (exportSettings.videoCanvasWidth < exportSettings.screenSize.width())
        exportSettings.videoCanvasWidth = exportSettings.screenSize.width();
}

QString PipelineConfig::defaultFilePath() {
    const QString dir = QCoreApplication::instance() ? QCoreApplication::applicationDirPath()
                                                     : QDir::currentPath();
    return QDir(dir).filePath(AppConstants::DefaultConfigFileName);
}
