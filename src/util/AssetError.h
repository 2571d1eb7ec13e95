#pragma once

#include <QString>
#include <stdexcept>

enum class AssetErrorKind {
    None,
    AlreadyRunning,
    InvalidInput,
    EncoderUnavailable,
    FrameReadFailure,
    EncodeFailed,
    Cancelled,
    UnknownDimensions,
    ManifestWriteFailure,
    IoFailure
};

const char* assetErrorKindName(AssetErrorKind kind);

class AssetError : public std::runtime_error {
public:
    AssetError(AssetErrorKind kind, const QString& message);

    AssetErrorKind kind() const { return m_kind; }
    QString message() const { return m_message; }

private:
    AssetErrorKind m_kind;
    QString m_message;
};
