#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTimer>
#include <atomic>
#include <csignal>
#include <cstdio>
#include "AppConstants.h"
#include "ExportService.h"
#include "LegacyMigrator.h"
#include "Log.h"
#include "PipelineConfig.h"

namespace {

constexpr int ExitOk = 0;
constexpr int ExitFailure = 1;
constexpr int ExitCancelled = 2;
constexpr int ExitUsage = 64;

std::atomic<bool> s_interrupted{false};

void onInterrupt(int) {
    s_interrupted.store(true);
}

int usageError(const QCommandLineParser& parser, const QString& message) {
    std::fprintf(stderr, "%s\n\n%s", qUtf8Printable(message), qUtf8Printable(parser.helpText()));
    return ExitUsage;
}

bool parseCrop(const QString& text, QRect* crop) {
    const QStringList parts = text.split(',');
    if (parts.size() != 4) return false;

    int values[4];
    for (int i = 0; i < 4; ++i) {
        bool ok = false;
        values[i] = parts[i].trimmed().toInt(&ok);
        if (!ok) return false;
    }
    *crop = QRect(values[0], values[1], values[2], values[3]);
    return true;
}

// Builds the clip selection shared by --loop and --intro.
bool videoParams(const QCommandLineParser& parser, const QString& source,
                 VideoExportParams* params, QString* error) {
    params->sourcePath = source;

    if (!parser.isSet("crop") || !parseCrop(parser.value("crop"), &params->cropBox)) {
        *error = "--crop x,y,w,h is required for video export";
        return false;
    }

    bool startOk = false;
    bool endOk = false;
    params->startFrame = parser.value("start").toLongLong(&startOk);
    params->endFrame = parser.value("end").toLongLong(&endOk);
    if (!startOk || !endOk) {
        *error = "--start and --end must be frame numbers";
        return false;
    }

    bool fpsOk = false;
    params->fps = parser.value("fps").toDouble(&fpsOk);
    if (!fpsOk || params->fps <= 0.0) {
        *error = "--fps must be a positive number";
        return false;
    }
    return true;
}

std::optional<ImageBuffer> loadImageOption(const QCommandLineParser& parser, const QString& name,
                                           QString* error) {
    if (!parser.isSet(name))
        return std::nullopt;

    ImageBuffer image = ImageBuffer::load(parser.value(name));
    if (!image.isValid()) {
        *error = QString("Cannot load image: %1").arg(parser.value(name));
        return std::nullopt;
    }
    return image;
}

int runExport(QCoreApplication& app, const QCommandLineParser& parser, const PipelineConfig& config) {
    if (!parser.isSet("out"))
        return usageError(parser, "--out is required");

    QString error;
    const auto logo = loadImageOption(parser, "logo", &error);
    const auto overlay = loadImageOption(parser, "overlay", &error);
    const auto display = loadImageOption(parser, "display", &error);
    if (!error.isEmpty()) {
        EPA_LOG_ERROR("{}", qUtf8Printable(error));
        return ExitFailure;
    }

    std::optional<VideoExportParams> loopVideo;
    std::optional<VideoExportParams> introVideo;
    if (parser.isSet("loop")) {
        VideoExportParams params;
        if (!videoParams(parser, parser.value("loop"), &params, &error))
            return usageError(parser, error);
        loopVideo = params;
    }
    if (parser.isSet("intro")) {
        VideoExportParams params;
        if (!videoParams(parser, parser.value("intro"), &params, &error))
            return usageError(parser, error);
        introVideo = params;
    }

    Metadata metadata;
    for (const QString& entry : parser.values("meta")) {
        const int eq = entry.indexOf('=');
        if (eq <= 0)
            return usageError(parser, QString("Invalid --meta entry: %1").arg(entry));
        metadata.emplace_back(entry.left(eq), entry.mid(eq + 1));
    }

    ExportService service(config.exportSettings);

    QObject::connect(&service, &ExportService::progressUpdated, &app, [](int percent, const QString& message) {
        std::printf("[%3d%%] %s\n", percent, qUtf8Printable(message));
        std::fflush(stdout);
    });
    QObject::connect(&service, &ExportService::exportCompleted, &app, [&app](const QString& message) {
        std::printf("%s\n", qUtf8Printable(message));
        app.exit(ExitOk);
    });
    QObject::connect(&service, &ExportService::exportFailed, &app, [&app](const QString& message) {
        std::fprintf(stderr, "%s\n", qUtf8Printable(message));
        app.exit(ExitFailure);
    });
    QObject::connect(&service, &ExportService::exportCancelled, &app, [&app](const QString& message) {
        std::printf("%s\n", qUtf8Printable(message));
        app.exit(ExitCancelled);
    });

    if (!service.exportAll(parser.value("out"), logo, overlay, display, loopVideo, introVideo, metadata))
        return ExitFailure;

    QTimer interruptPoll;
    QObject::connect(&interruptPoll, &QTimer::timeout, &service, [&service]() {
        if (s_interrupted.exchange(false)) {
            EPA_LOG_INFO("Interrupt received, cancelling export");
            service.cancel();
        }
    });
    interruptPoll.start(100);

    const int code = app.exec();
    service.wait();
    return code;
}

void printResult(const ConversionResult& result) {
    std::printf("%s %s: %s\n", result.success ? "OK  " : "FAIL",
                qUtf8Printable(result.sourcePath), qUtf8Printable(result.message));
}

int runMigrate(const QCommandLineParser& parser, const PipelineConfig& config) {
    if (!parser.isSet("src") || !parser.isSet("dst"))
        return usageError(parser, "--src and --dst are required");

    LegacyMigrator migrator(config.logoSize);
    migrator.batchConvert(parser.value("src"), parser.value("dst"),
                          [](int index, int total, const QString& name) {
        std::printf("[%d/%d] %s\n", index, total, qUtf8Printable(name));
        std::fflush(stdout);
    });

    bool allOk = !migrator.results().empty();
    for (const auto& result : migrator.results()) {
        printResult(result);
        allOk = allOk && result.success;
    }
    std::printf("%s\n", qUtf8Printable(migrator.summary()));
    return allOk ? ExitOk : ExitFailure;
}

int runMigrateFolder(const QCommandLineParser& parser, const PipelineConfig& config) {
    if (!parser.isSet("src") || !parser.isSet("dst"))
        return usageError(parser, "--src and --dst are required");

    LegacyMigrator migrator(config.logoSize);
    const ConversionResult result = migrator.convertFolder(parser.value("src"), parser.value("dst"));

    printResult(result);
    return result.success ? ExitOk : ExitFailure;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    QCommandLineParser parser;
    parser.setApplicationDescription("Builds device asset packages and migrates legacy asset folders.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "export | migrate | migrate-folder");
    parser.addOptions({
        {"config", "Configuration file.", "file", PipelineConfig::defaultFilePath()},
        {"out", "Output directory for export.", "dir"},
        {"logo", "Logo image.", "image"},
        {"overlay", "Overlay image.", "image"},
        {"display", "Display image.", "image"},
        {"loop", "Source video for the loop clip.", "video"},
        {"intro", "Source video for the intro clip.", "video"},
        {"crop", "Crop box in source pixels.", "x,y,w,h"},
        {"start", "First source frame.", "frame", "0"},
        {"end", "Source frame after the last one exported.", "frame", "0"},
        {"fps", "Output frame rate.", "fps", "30"},
        {"meta", "Manifest entry, may repeat.", "key=value"},
        {"src", "Legacy source folder or root.", "dir"},
        {"dst", "Destination folder or root.", "dir"},
    });

    if (!parser.parse(app.arguments()))
        return usageError(parser, parser.errorText());
    if (parser.isSet("help")) {
        std::printf("%s", qUtf8Printable(parser.helpText()));
        return ExitOk;
    }
    if (parser.isSet("version")) {
        std::printf("%s %s\n", AppConstants::AppName, AppConstants::AppVersion);
        return ExitOk;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1)
        return usageError(parser, "Expected exactly one command");

    PipelineConfig config;
    const bool configOk = config.load(parser.value("config"));
    Log::init(config.log);
    if (!configOk)
        EPA_LOG_WARN("Using default configuration: {}", qUtf8Printable(config.errorString()));

    std::signal(SIGINT, onInterrupt);

    const QString command = positional.first();
    if (command == "export")
        return runExport(app, parser, config);
    if (command == "migrate")
        return runMigrate(parser, config);
    if (command == "migrate-folder")
        return runMigrateFolder(parser, config);

    return usageError(parser, QString("Unknown command: %1").arg(command));
}
