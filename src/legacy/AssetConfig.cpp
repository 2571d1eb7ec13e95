#include "AssetConfig.h"
#include "Log.h"

#include <QFile>
#include <QJsonDocument>
#include <QSaveFile>

namespace {

QString overlayTypeToString(OverlayType type) {
    return type == OverlayType::Arknights ? "arknights" : "none";
}

OverlayType overlayTypeFromString(const QString& value) {
    return value == "arknights" ? OverlayType::Arknights : OverlayType::None;
}

} // namespace

bool AssetConfig::saveToFile(const QString& filePath) const {
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

std::optional<AssetConfig> AssetConfig::loadFromFile(const QString& filePath, QString* error) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = QString("Cannot read: %1").arg(filePath);
        return std::nullopt;
    }

    QJsonParseError parseError;
    auto doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        if (error) *error = QString("Invalid config format: %1").arg(parseError.errorString());
        return std::nullopt;
    }
    return fromJson(doc.object());
}

QJsonObject AssetConfig::toJson() const {
    QJsonObject root;
    root["name"] = name;
    root["description"] = description;
    if (icon)
        root["icon"] = *icon;

    QJsonObject loopObj;
    loopObj["file"] = loop.file;
    root["loop"] = loopObj;

    QJsonObject overlayObj;
    overlayObj["type"] = overlayTypeToString(overlay.type);
    if (overlay.arknightsOptions) {
        const ArknightsOverlayOptions& opts = *overlay.arknightsOptions;
        QJsonObject optsObj;
        optsObj["operator_name"] = opts.operatorName;
        optsObj["color"] = opts.color;
        if (opts.logo)
            optsObj["logo"] = *opts.logo;
        overlayObj["arknights_options"] = optsObj;
    }
    root["overlay"] = overlayObj;
    return root;
}

AssetConfig AssetConfig::fromJson(const QJsonObject& obj) {
    AssetConfig config;
    config.name = obj["name"].toString();
    config.description = obj["description"].toString();
    if (obj.contains("icon"))
        config.icon = obj["icon"].toString();

    config.loop.file = obj["loop"].toObject()["file"].toString();

    const QJsonObject overlayObj = obj["overlay"].toObject();
    config.overlay.type = overlayTypeFromString(overlayObj["type"].toString());
    if (overlayObj.contains("arknights_options")) {
        const QJsonObject optsObj = overlayObj["arknights_options"].toObject();
        ArknightsOverlayOptions opts;
        opts.operatorName = optsObj["operator_name"].toString();
        opts.color = optsObj["color"].toString("#000000");
        if (optsObj.contains("logo"))
            opts.logo = optsObj["logo"].toString();
        config.overlay.arknightsOptions = opts;
    }
    return config;
}
