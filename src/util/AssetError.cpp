#include "AssetError.h"

const char* assetErrorKindName(AssetErrorKind kind) {
    switch (kind) {
    case AssetErrorKind::None:                 return "None";
    case AssetErrorKind::AlreadyRunning:       return "AlreadyRunning";
    case AssetErrorKind::InvalidInput:         return "InvalidInput";
    case AssetErrorKind::EncoderUnavailable:   return "EncoderUnavailable";
    case AssetErrorKind::FrameReadFailure:     return "FrameReadFailure";
    case AssetErrorKind::EncodeFailed:         return "EncodeFailed";
    case AssetErrorKind::Cancelled:            return "Cancelled";
    case AssetErrorKind::UnknownDimensions:    return "UnknownDimensions";
    case AssetErrorKind::ManifestWriteFailure: return "ManifestWriteFailure";
    case AssetErrorKind::IoFailure:            return "IoFailure";
    }
    return "Unknown";
}

AssetError::AssetError(AssetErrorKind kind, const QString& message)
    : std::runtime_error(message.toStdString())
    , m_kind(kind)
    , m_message(message)
{}
