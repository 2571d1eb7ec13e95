#pragma once

#include <QJsonObject>
#include <QString>
#include <optional>

enum class OverlayType {
    None,
    Arknights
};

struct ArknightsOverlayOptions {
    QString operatorName;
    QString color = "#000000";
    std::optional<QString> logo;
};

struct Overlay {
    OverlayType type = OverlayType::None;
    std::optional<ArknightsOverlayOptions> arknightsOptions;
};

struct LoopSettings {
    QString file;
};

// Current-schema asset configuration (epconfig.json).
class AssetConfig {
public:
    QString name;
    QString description;
    std::optional<QString> icon;
    LoopSettings loop;
    Overlay overlay;

    bool saveToFile(const QString& filePath) const;
    static std::optional<AssetConfig> loadFromFile(const QString& filePath, QString* error = nullptr);

    QJsonObject toJson() const;
    static AssetConfig fromJson(const QJsonObject& obj);
};
