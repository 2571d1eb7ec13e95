#pragma once

#include <QObject>
#include <QString>
#include <memory>
#include <optional>
#include "ExportProgressSink.h"
#include "ExportTask.h"

class ExportRunner;

// Entry point for callers that think in assets rather than tasks. Builds the task
// list in client order (logo, overlay, display, loop, intro) and forwards runner
// notifications as signals. Signals are emitted from the export thread.
class ExportService : public QObject, private ExportProgressSink {
    Q_OBJECT
public:
    explicit ExportService(const ExportSettings& settings = ExportSettings{}, QObject* parent = nullptr);
    ~ExportService() override;

    bool exportAll(const QString& outputDir,
                   const std::optional<ImageBuffer>& logo,
                   const std::optional<ImageBuffer>& overlay = std::nullopt,
                   const std::optional<ImageBuffer>& display = std::nullopt,
                   const std::optional<VideoExportParams>& loopVideo = std::nullopt,
                   const std::optional<VideoExportParams>& introVideo = std::nullopt,
                   const Metadata& metadata = Metadata{});

    bool exportLogo(const QString& outputDir, const ImageBuffer& image, const Metadata& metadata = Metadata{});
    bool exportOverlay(const QString& outputDir, const ImageBuffer& image, const Metadata& metadata = Metadata{});
    bool exportDisplay(const QString& outputDir, const ImageBuffer& image, const Metadata& metadata = Metadata{});

    // videoType is "loop" or "intro"
    bool exportVideo(const QString& outputDir, const QString& videoType,
                     const VideoExportParams& params, const Metadata& metadata = Metadata{});

    void cancel();
    void wait();
    bool isExporting() const;

    bool encoderAvailable();
    QString encoderPath();
    bool setEncoderPath(const QString& path);

    AssetErrorKind lastError() const { return m_lastError; }
    QString errorString() const { return m_error; }

signals:
    void progressUpdated(int percent, const QString& message);
    void exportCompleted(const QString& message);
    void exportFailed(const QString& message);
    void exportCancelled(const QString& message);

private:
    void progress(int percent, const QString& message) override;
    void finished(const ExportOutcome& outcome) override;

    bool submit(ExportBatch batch);
    bool fail(AssetErrorKind kind, const QString& message);

    ExportSettings m_settings;
    bool m_encoderResolved = false;
    AssetErrorKind m_lastError = AssetErrorKind::None;
    QString m_error;
    std::unique_ptr<ExportRunner> m_runner;
};
