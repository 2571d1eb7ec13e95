#include "LegacyMigrator.h"
#include "AssetConfig.h"
#include "AssetError.h"
#include "ImageBuffer.h"
#include "Log.h"
#include "PixelCodec.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>

namespace {

bool isHexColor(const QString& value) {
    static const QRegularExpression re("^[0-9A-Fa-f]{6}$");
    return re.match(value).hasMatch();
}

} // namespace

LegacyMigrator::LegacyMigrator(QSize logoSize)
    : m_logoSize(logoSize)
{}

bool LegacyMigrator::detect(const QString& folderPath) const {
    QDir dir(folderPath);
    if (!dir.exists()) return false;

    return QFileInfo::exists(dir.filePath(AppConstants::LegacyConfigFileName))
        && QFileInfo::exists(dir.filePath(AppConstants::LegacyLoopFileName));
}

std::optional<LegacyConfig> LegacyMigrator::parseConfigText(const QString& text, QString* error) {
    static const QRegularExpression whitespace("\\s+");
    const QStringList parts = text.trimmed().split(whitespace, Qt::SkipEmptyParts);

    LegacyConfig config;
    if (parts.size() >= 1) {
        bool ok = false;
        config.version = parts[0].toInt(&ok);
        if (!ok) {
            if (error) *error = QString("Invalid version '%1'").arg(parts[0]);
            return std::nullopt;
        }
    }
    if (parts.size() >= 2) {
        // AARRGGBB drops the alpha pair
        QString hex = parts[1];
        if (hex.size() == 8)
            hex = hex.mid(2);
        if (!isHexColor(hex)) {
            if (error) *error = QString("Invalid color '%1'").arg(parts[1]);
            return std::nullopt;
        }
        config.color = "#" + hex;
    }
    return config;
}

LegacyConfig LegacyMigrator::parseConfig(const QString& folderPath) const {
    const QString configPath = QDir(folderPath).filePath(AppConstants::LegacyConfigFileName);

    QFile file(configPath);
    if (!file.exists()) {
        EPA_LOG_WARN("Config file missing, using defaults: {}", qUtf8Printable(configPath));
        return LegacyConfig{};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        EPA_LOG_WARN("Cannot read {}, using defaults: {}", qUtf8Printable(configPath),
                     qUtf8Printable(file.errorString()));
        return LegacyConfig{};
    }

    QString error;
    const std::optional<LegacyConfig> parsed = parseConfigText(QString::fromUtf8(file.readAll()), &error);
    if (!parsed) {
        EPA_LOG_WARN("Malformed {} ({}), using defaults", qUtf8Printable(configPath), qUtf8Printable(error));
        return LegacyConfig{};
    }

    EPA_LOG_DEBUG("Legacy config: version={} color={}", parsed->version, qUtf8Printable(parsed->color));
    return *parsed;
}

bool LegacyMigrator::convertArgbToPng(const QString& argbPath, const QString& pngPath,
                                      int width, int height) const {
    QFile file(argbPath);
    if (!file.exists()) {
        EPA_LOG_WARN("Packed image missing: {}", qUtf8Printable(argbPath));
        return false;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        EPA_LOG_ERROR("Cannot read {}: {}", qUtf8Printable(argbPath), qUtf8Printable(file.errorString()));
        return false;
    }

    ImageBuffer image;
    try {
        image = PixelCodec::decode(file.readAll(), width, height);
    } catch (const AssetError& e) {
        EPA_LOG_ERROR("Cannot decode {} [{}]: {}", qUtf8Printable(argbPath),
                      assetErrorKindName(e.kind()), e.what());
        return false;
    }

    if (!image.toQImage().save(pngPath, "PNG")) {
        EPA_LOG_ERROR("Cannot write {}", qUtf8Printable(pngPath));
        return false;
    }

    EPA_LOG_INFO("Converted {} -> {}", qUtf8Printable(argbPath), qUtf8Printable(pngPath));
    return true;
}

bool LegacyMigrator::copyVideoFile(const QString& srcPath, const QString& dstPath) const {
    if (!QFileInfo::exists(srcPath)) {
        EPA_LOG_WARN("Video file missing: {}", qUtf8Printable(srcPath));
        return false;
    }

    if (QFileInfo::exists(dstPath) && !QFile::remove(dstPath)) {
        EPA_LOG_ERROR("Cannot replace {}", qUtf8Printable(dstPath));
        return false;
    }
    if (!QFile::copy(srcPath, dstPath)) {
        EPA_LOG_ERROR("Cannot copy {} -> {}", qUtf8Printable(srcPath), qUtf8Printable(dstPath));
        return false;
    }

    // QFile::copy keeps permissions only; carry the modification time over as well
    QFile copied(dstPath);
    if (!copied.open(QIODevice::ReadWrite)
        || !copied.setFileTime(QFileInfo(srcPath).lastModified(), QFileDevice::FileModificationTime)) {
        EPA_LOG_WARN("Cannot preserve modification time of {}", qUtf8Printable(dstPath));
    }

    EPA_LOG_INFO("Copied video {}", qUtf8Printable(dstPath));
    return true;
}

bool LegacyMigrator::generateConfig(const LegacyConfig& legacyConfig, const QString& folderName,
                                    const QString& dstDir, bool hasLogo) const {
    AssetConfig config;
    config.name = folderName;
    config.description = QString("Converted from legacy asset: %1").arg(folderName);
    config.loop.file = AppConstants::LegacyLoopFileName;

    ArknightsOverlayOptions options;
    options.operatorName = folderName;
    options.color = legacyConfig.color;
    if (hasLogo)
        options.logo = QString(AppConstants::ConvertedLogoFileName);

    config.overlay.type = OverlayType::Arknights;
    config.overlay.arknightsOptions = options;

    if (hasLogo)
        config.icon = QString(AppConstants::ConvertedLogoFileName);

    const QString configPath = QDir(dstDir).filePath(AppConstants::ConvertedConfigFileName);
    if (!config.saveToFile(configPath))
        return false;

    EPA_LOG_INFO("Generated config {}", qUtf8Printable(configPath));
    return true;
}

ConversionResult LegacyMigrator::convertFolder(const QString& srcDir, const QString& dstDir) {
    const QString folderName = QFileInfo(QDir::cleanPath(srcDir)).fileName();
    EPA_LOG_INFO("Converting {}", qUtf8Printable(folderName));

    ConversionResult result;
    result.sourcePath = srcDir;
    result.destPath = dstDir;

    if (!detect(srcDir)) {
        result.message = "Not a legacy asset folder";
        EPA_LOG_WARN("{}: {}", qUtf8Printable(folderName), qUtf8Printable(result.message));
        m_results.push_back(result);
        return result;
    }

    if (!QDir().mkpath(dstDir)) {
        result.message = QString("Cannot create destination %1").arg(dstDir);
        EPA_LOG_ERROR("{}: {}", qUtf8Printable(folderName), qUtf8Printable(result.message));
        m_results.push_back(result);
        return result;
    }

    const QDir src(srcDir);
    const QDir dst(dstDir);
    const LegacyConfig legacyConfig = parseConfig(srcDir);

    bool hasLogo = false;
    const QString logoSrc = src.filePath(AppConstants::LegacyLogoFileName);
    if (QFileInfo::exists(logoSrc)) {
        hasLogo = convertArgbToPng(logoSrc, dst.filePath(AppConstants::ConvertedLogoFileName),
                                   m_logoSize.width(), m_logoSize.height());
        if (hasLogo)
            result.filesConverted << AppConstants::ConvertedLogoFileName;
    }

    if (copyVideoFile(src.filePath(AppConstants::LegacyLoopFileName), dst.filePath(AppConstants::LegacyLoopFileName)))
        result.filesConverted << AppConstants::LegacyLoopFileName;

    if (generateConfig(legacyConfig, folderName, dstDir, hasLogo))
        result.filesConverted << AppConstants::ConvertedConfigFileName;

    result.success = !result.filesConverted.isEmpty();
    result.message = QString("Converted %1 file(s)").arg(result.filesConverted.size());

    EPA_LOG_INFO("{}: {}", qUtf8Printable(folderName), qUtf8Printable(result.message));
    m_results.push_back(result);
    return result;
}

std::vector<ConversionResult> LegacyMigrator::batchConvert(const QString& srcRoot, const QString& dstRoot,
                                                           const ProgressCallback& progress) {
    clearResults();

    QDir root(srcRoot);
    if (!root.exists()) {
        EPA_LOG_ERROR("Source directory does not exist: {}", qUtf8Printable(srcRoot));
        return {};
    }

    QStringList folders;
    const QStringList entries = root.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString& name : entries) {
        if (detect(root.filePath(name)))
            folders << name;
    }

    if (folders.isEmpty()) {
        EPA_LOG_WARN("No legacy asset folders in {}", qUtf8Printable(srcRoot));
        return {};
    }

    EPA_LOG_INFO("Found {} legacy asset folder(s)", folders.size());

    if (!QDir().mkpath(dstRoot)) {
        EPA_LOG_ERROR("Cannot create destination root {}", qUtf8Printable(dstRoot));
    }

    const int total = static_cast<int>(folders.size());
    for (int i = 0; i < total; ++i) {
        const QString& name = folders[i];
        if (progress)
            progress(i + 1, total, name);

        try {
            convertFolder(root.filePath(name), QDir(dstRoot).filePath(name));
        } catch (const std::exception& e) {
            ConversionResult result;
            result.sourcePath = root.filePath(name);
            result.destPath = QDir(dstRoot).filePath(name);
            result.message = QString("Conversion failed: %1").arg(QString::fromUtf8(e.what()));
            EPA_LOG_ERROR("{}: {}", qUtf8Printable(name), qUtf8Printable(result.message));
            m_results.push_back(result);
        }
    }

    EPA_LOG_INFO("{}", qUtf8Printable(summary()));
    return m_results;
}

QString LegacyMigrator::summary() const {
    if (m_results.empty())
        return "No conversion results";

    int succeeded = 0;
    int files = 0;
    for (const auto& r : m_results) {
        if (r.success) ++succeeded;
        files += static_cast<int>(r.filesConverted.size());
    }
    return QString("%1/%2 folders succeeded, %3 files total")
        .arg(succeeded).arg(m_results.size()).arg(files);
}
