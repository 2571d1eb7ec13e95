#pragma once

#include <QSize>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>
#include <vector>
#include "AppConstants.h"

struct LegacyConfig {
    int version = 0;
    QString color = "#000000";
};

struct ConversionResult {
    bool success = false;
    QString sourcePath;
    QString destPath;
    QString message;
    QStringList filesConverted;
};

// Upgrades asset folders written by the old toolchain:
//   epconfig.txt -> epconfig.json, logo.argb -> logo.png, loop.mp4 copied as is.
// Folders are independent; a failing folder never stops a batch.
class LegacyMigrator {
public:
    // index is 1-based
    using ProgressCallback = std::function<void(int index, int total, const QString& name)>;

    // logoSize is the assumed raster size of logo.argb files
    explicit LegacyMigrator(QSize logoSize = QSize(AppConstants::LogoWidth, AppConstants::LogoHeight));

    // True iff epconfig.txt and loop.mp4 both exist directly in the folder.
    bool detect(const QString& folderPath) const;

    // Never fails: an absent or malformed epconfig.txt gives the default config.
    LegacyConfig parseConfig(const QString& folderPath) const;

    // "<version> <AARRGGBB|RRGGBB>", both tokens optional. nullopt when a token is malformed.
    static std::optional<LegacyConfig> parseConfigText(const QString& text, QString* error = nullptr);

    bool convertArgbToPng(const QString& argbPath, const QString& pngPath,
                          int width = AppConstants::LogoWidth,
                          int height = AppConstants::LogoHeight) const;
    bool copyVideoFile(const QString& srcPath, const QString& dstPath) const;
    bool generateConfig(const LegacyConfig& legacyConfig, const QString& folderName,
                        const QString& dstDir, bool hasLogo) const;

    ConversionResult convertFolder(const QString& srcDir, const QString& dstDir);

    // Converts every legacy folder directly under srcRoot into dstRoot/<name>, in name order.
    std::vector<ConversionResult> batchConvert(const QString& srcRoot, const QString& dstRoot,
                                               const ProgressCallback& progress = ProgressCallback());

    const std::vector<ConversionResult>& results() const { return m_results; }
    void clearResults() { m_results.clear(); }

    // "N/M folders succeeded, K files total"
    QString summary() const;

private:
    QSize m_logoSize;
    std::vector<ConversionResult> m_results;
};
