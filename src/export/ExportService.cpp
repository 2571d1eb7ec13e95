#include "ExportService.h"
#include "ExportRunner.h"
#include "Log.h"
#include "VideoEncoder.h"

#include <QFileInfo>

ExportService::ExportService(const ExportSettings& settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_runner(std::make_unique<ExportRunner>(this, settings))
{}

ExportService::~ExportService() {
    // The runner calls back into this object; stop it before members go away
    m_runner.reset();
}

bool ExportService::exportAll(const QString& outputDir,
                              const std::optional<ImageBuffer>& logo,
                              const std::optional<ImageBuffer>& overlay,
                              const std::optional<ImageBuffer>& display,
                              const std::optional<VideoExportParams>& loopVideo,
                              const std::optional<VideoExportParams>& introVideo,
                              const Metadata& metadata) {
    if (isExporting())
        return fail(AssetErrorKind::AlreadyRunning, "An export is already running");

    ExportBatch batch;
    batch.outputDir = outputDir;
    batch.metadata = metadata;

    if (logo)
        batch.tasks.push_back(ExportTask::image(ExportTaskKind::Logo, *logo));
    if (overlay)
        batch.tasks.push_back(ExportTask::image(ExportTaskKind::Overlay, *overlay));
    if (display)
        batch.tasks.push_back(ExportTask::image(ExportTaskKind::Display, *display));

    if (loopVideo || introVideo) {
        if (!encoderAvailable())
            return fail(AssetErrorKind::EncoderUnavailable, "ffmpeg not found, cannot export video");
    }
    if (loopVideo)
        batch.tasks.push_back(ExportTask::video(ExportTaskKind::LoopVideo, *loopVideo));
    if (introVideo)
        batch.tasks.push_back(ExportTask::video(ExportTaskKind::IntroVideo, *introVideo));

    if (batch.tasks.empty())
        return fail(AssetErrorKind::InvalidInput, "Nothing to export");

    return submit(std::move(batch));
}

bool ExportService::exportLogo(const QString& outputDir, const ImageBuffer& image, const Metadata& metadata) {
    return exportAll(outputDir, image, std::nullopt, std::nullopt, std::nullopt, std::nullopt, metadata);
}

bool ExportService::exportOverlay(const QString& outputDir, const ImageBuffer& image, const Metadata& metadata) {
    return exportAll(outputDir, std::nullopt, image, std::nullopt, std::nullopt, std::nullopt, metadata);
}

bool ExportService::exportDisplay(const QString& outputDir, const ImageBuffer& image, const Metadata& metadata) {
    return exportAll(outputDir, std::nullopt, std::nullopt, image, std::nullopt, std::nullopt, metadata);
}

bool ExportService::exportVideo(const QString& outputDir, const QString& videoType,
                                const VideoExportParams& params, const Metadata& metadata) {
    if (videoType == "loop")
        return exportAll(outputDir, std::nullopt, std::nullopt, std::nullopt, params, std::nullopt, metadata);
    if (videoType == "intro")
        return exportAll(outputDir, std::nullopt, std::nullopt, std::nullopt, std::nullopt, params, metadata);
    return fail(AssetErrorKind::InvalidInput, QString("Unknown video type: %1").arg(videoType));
}

void ExportService::cancel() {
    if (!isExporting()) {
        EPA_LOG_WARN("No export in progress");
        return;
    }
    m_runner->cancel();
}

void ExportService::wait() {
    m_runner->wait();
}

bool ExportService::isExporting() const {
    return m_runner->isRunning();
}

bool ExportService::encoderAvailable() {
    return !encoderPath().isEmpty();
}

QString ExportService::encoderPath() {
    if (!m_encoderResolved) {
        m_settings.encoder.encoderPath = VideoEncoder::locate(m_settings.encoder.encoderPath);
        m_encoderResolved = true;
    }
    return m_settings.encoder.encoderPath;
}

bool ExportService::setEncoderPath(const QString& path) {
    if (!QFileInfo(path).isFile()) {
        m_lastError = AssetErrorKind::InvalidInput;
        m_error = QString("ffmpeg executable does not exist: %1").arg(path);
        EPA_LOG_WARN("{}", qUtf8Printable(m_error));
        return false;
    }
    m_settings.encoder.encoderPath = QFileInfo(path).absoluteFilePath();
    m_encoderResolved = true;
    EPA_LOG_INFO("Encoder set to {}", qUtf8Printable(m_settings.encoder.encoderPath));
    return true;
}

void ExportService::progress(int percent, const QString& message) {
    emit progressUpdated(percent, message);
}

void ExportService::finished(const ExportOutcome& outcome) {
    switch (outcome.status) {
    case ExportOutcome::Status::Completed:
        emit exportCompleted(outcome.message());
        break;
    case ExportOutcome::Status::Failed:
        emit exportFailed(outcome.message());
        break;
    case ExportOutcome::Status::Cancelled:
        emit exportCancelled(outcome.message());
        break;
    }
}

bool ExportService::submit(ExportBatch batch) {
    encoderPath();
    m_runner->setSettings(m_settings);

    const int taskCount = static_cast<int>(batch.tasks.size());
    const QString outputDir = batch.outputDir;
    if (!m_runner->start(std::move(batch)))
        return fail(m_runner->lastError(), m_runner->errorString());

    m_lastError = AssetErrorKind::None;
    m_error.clear();
    EPA_LOG_INFO("Queued {} export task(s) for {}", taskCount, qUtf8Printable(outputDir));
    return true;
}

bool ExportService::fail(AssetErrorKind kind, const QString& message) {
    m_lastError = kind;
    m_error = message;
    EPA_LOG_WARN("Export request rejected [{}]: {}", assetErrorKindName(kind), qUtf8Printable(message));
    emit exportFailed(message);
    return false;
}
