#include <cassert>
#include <cstdio>
#include <QByteArray>
#include "media/ImageBuffer.h"
#include "media/PixelCodec.h"
#include "util/AssetError.h"

static QByteArray bytes(std::initializer_list<int> values) {
    QByteArray out;
    for (int v : values) out.append(static_cast<char>(v));
    return out;
}

// Distinct colors: (0,0)=1,2,3  (1,0)=4,5,6  (0,1)=7,8,9  (1,1)=10,11,12
static ImageBuffer fixture2x2(int channels) {
    ImageBuffer img(2, 2, channels);
    int value = 1;
    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 2; ++x) {
            uchar* p = img.pixel(x, y);
            p[0] = static_cast<uchar>(value++);
            p[1] = static_cast<uchar>(value++);
            p[2] = static_cast<uchar>(value++);
            if (channels == 4) p[3] = static_cast<uchar>(100 + x + 2 * y);
        }
    }
    return img;
}

void test_encode_size_and_opaque_alpha() {
    ImageBuffer img(7, 5, 3);
    for (int i = 0; i < img.data.size(); ++i)
        img.data[i] = static_cast<char>(i % 251);

    QByteArray packed = PixelCodec::encode(img);
    assert(packed.size() == 7 * 5 * 4);
    for (int i = 3; i < packed.size(); i += 4)
        assert(static_cast<uchar>(packed[i]) == 255);

    printf("PASS: test_encode_size_and_opaque_alpha\n");
}

void test_encode_standard_rotates_180() {
    QByteArray packed = PixelCodec::encode(fixture2x2(3), PixelCodec::PackLayout::Standard);
    QByteArray expected = bytes({
        12, 11, 10, 255,   9, 8, 7, 255,
         6,  5,  4, 255,   3, 2, 1, 255,
    });
    assert(packed == expected);
    printf("PASS: test_encode_standard_rotates_180\n");
}

void test_encode_logo_mirrors_horizontally() {
    QByteArray packed = PixelCodec::encode(fixture2x2(3), PixelCodec::PackLayout::Logo);
    QByteArray expected = bytes({
         6,  5,  4, 255,   3, 2, 1, 255,
        12, 11, 10, 255,   9, 8, 7, 255,
    });
    assert(packed == expected);
    printf("PASS: test_encode_logo_mirrors_horizontally\n");
}

void test_encode_alpha_handling() {
    ImageBuffer rgba = fixture2x2(4);

    // Standard keeps source alpha (rotated along with the pixel)
    QByteArray standard = PixelCodec::encode(rgba, PixelCodec::PackLayout::Standard);
    assert(static_cast<uchar>(standard[3]) == 103);
    assert(static_cast<uchar>(standard[7]) == 102);
    assert(static_cast<uchar>(standard[11]) == 101);
    assert(static_cast<uchar>(standard[15]) == 100);

    // Logo is always opaque
    QByteArray logo = PixelCodec::encode(rgba, PixelCodec::PackLayout::Logo);
    for (int i = 3; i < logo.size(); i += 4)
        assert(static_cast<uchar>(logo[i]) == 255);

    printf("PASS: test_encode_alpha_handling\n");
}

void test_encode_rejects_invalid_buffer() {
    ImageBuffer broken(4, 4, 3);
    broken.data.chop(1);

    bool threw = false;
    try {
        PixelCodec::encode(broken);
    } catch (const AssetError& e) {
        threw = e.kind() == AssetErrorKind::InvalidInput;
    }
    assert(threw);
    printf("PASS: test_encode_rejects_invalid_buffer\n");
}

void test_decode_argb() {
    QByteArray argb = bytes({
        0x80, 0x10, 0x20, 0x30,   0xff, 0x40, 0x50, 0x60,
    });
    ImageBuffer img = PixelCodec::decode(argb, 2, 1);
    assert(img.width == 2 && img.height == 1 && img.channels == 4);

    const uchar* p0 = img.pixel(0, 0);
    assert(p0[0] == 0x10 && p0[1] == 0x20 && p0[2] == 0x30 && p0[3] == 0x80);
    const uchar* p1 = img.pixel(1, 0);
    assert(p1[0] == 0x40 && p1[1] == 0x50 && p1[2] == 0x60 && p1[3] == 0xff);

    printf("PASS: test_decode_argb\n");
}

void test_decode_then_encode_reverses_tuple() {
    // Single pixel so rotation does not move anything
    QByteArray original = bytes({0x40, 0x11, 0x22, 0x33});
    QByteArray reencoded = PixelCodec::encode(PixelCodec::decode(original, 1, 1));

    assert(reencoded != original);
    // A,R,G,B in, B,G,R,A out: the tuple comes back reversed
    assert(reencoded[0] == original[3]);
    assert(reencoded[1] == original[2]);
    assert(reencoded[2] == original[1]);
    assert(reencoded[3] == original[0]);

    printf("PASS: test_decode_then_encode_reverses_tuple\n");
}

void test_detect_common_sizes() {
    auto check = [](int w, int h, int expectW, int expectH) {
        auto size = PixelCodec::detectDimensions(static_cast<qsizetype>(w) * h * 4);
        assert(size.has_value());
        assert(size->width() == expectW && size->height() == expectH);
    };

    check(256, 256, 256, 256);
    check(512, 512, 512, 512);
    check(128, 128, 128, 128);
    check(256, 512, 256, 512);
    check(360, 640, 360, 640);     // also 480x480, the list wins
    check(480, 854, 480, 854);
    check(720, 1280, 720, 1280);
    // 512x128 has the same pixel count as 256x256, which is listed first
    check(512, 128, 256, 256);

    printf("PASS: test_detect_common_sizes\n");
}

void test_detect_square_fallback() {
    auto size = PixelCodec::detectDimensions(4 * 100 * 100);
    assert(size.has_value());
    assert(size->width() == 100 && size->height() == 100);
    printf("PASS: test_detect_square_fallback\n");
}

void test_detect_unknown() {
    assert(!PixelCodec::detectDimensions(4 * 7919).has_value());
    assert(!PixelCodec::detectDimensions(0).has_value());
    assert(!PixelCodec::detectDimensions(6).has_value());

    bool threw = false;
    try {
        PixelCodec::decode(QByteArray(4 * 7919, '\0'), 256, 256);
    } catch (const AssetError& e) {
        threw = e.kind() == AssetErrorKind::UnknownDimensions;
    }
    assert(threw);
    printf("PASS: test_detect_unknown\n");
}

void test_decode_size_mismatch_uses_detection() {
    ImageBuffer img = PixelCodec::decode(QByteArray(128 * 128 * 4, '\x7f'), 256, 256);
    assert(img.width == 128 && img.height == 128);
    printf("PASS: test_decode_size_mismatch_uses_detection\n");
}

int main() {
    test_encode_size_and_opaque_alpha();
    test_encode_standard_rotates_180();
    test_encode_logo_mirrors_horizontally();
    test_encode_alpha_handling();
    test_encode_rejects_invalid_buffer();
    test_decode_argb();
    test_decode_then_encode_reverses_tuple();
    test_detect_common_sizes();
    test_detect_square_fallback();
    test_detect_unknown();
    test_decode_size_mismatch_uses_detection();
    printf("All pixel codec tests passed.\n");
    return 0;
}
