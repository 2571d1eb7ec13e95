#pragma once

#include <QJsonObject>
#include <QSize>
#include <QString>
#include "ExportTask.h"
#include "Log.h"

// Tool-wide settings read from ep_assetmaker.json. Every key is optional.
class PipelineConfig {
public:
    ExportSettings exportSettings;
    QSize logoSize{AppConstants::LogoWidth, AppConstants::LogoHeight};
    LogSettings log;

    // A missing file keeps the defaults and succeeds. An unreadable or malformed
    // file keeps the defaults, sets errorString() and returns false.
    bool load(const QString& filePath);
    bool save(const QString& filePath) const;

    QJsonObject toJson() const;
    void applyJson(const QJsonObject& root);

    QString errorString() const { return m_error; }

    static QString defaultFilePath();

private:
    QString m_error;
};
