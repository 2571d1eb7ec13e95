#pragma once

#include <QString>

namespace AppConstants {
    inline constexpr const char* AppName = "EpAssetMaker";
    inline constexpr const char* AppVersion = "0.1.0";
    inline constexpr const char* OrgName = "EpAssetMaker";

    inline constexpr const char* DefaultConfigFileName = "ep_assetmaker.json";

    // Target client screen and video canvas
    inline constexpr int ScreenWidth = 360;
    inline constexpr int ScreenHeight = 640;
    inline constexpr int VideoCanvasWidth = 384;

    inline constexpr int LogoWidth = 256;
    inline constexpr int LogoHeight = 256;

    // Export outputs
    inline constexpr const char* ManifestFileName = "epconfig.txt";
    inline constexpr const char* TempFramesTemplate = "temp_frames-XXXXXX";
    // Temp frames are <prefix><zero padded index><suffix>
    inline constexpr const char* FrameFilePrefix = "frame_";
    inline constexpr const char* FrameFileSuffix = ".png";
    inline constexpr int FrameIndexWidth = 6;

    // Progress update interval during frame extraction (source frames)
    inline constexpr int FrameProgressInterval = 10;

    // Encoder diagnostics are cut to this many characters in error messages
    inline constexpr int EncoderStderrExcerpt = 200;

    // Legacy asset folder layout
    inline constexpr const char* LegacyConfigFileName = "epconfig.txt";
    inline constexpr const char* LegacyLoopFileName = "loop.mp4";
    inline constexpr const char* LegacyLogoFileName = "logo.argb";
    inline constexpr const char* ConvertedLogoFileName = "logo.png";
    inline constexpr const char* ConvertedConfigFileName = "epconfig.json";
}
