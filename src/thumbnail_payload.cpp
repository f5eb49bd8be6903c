#include "thumbnail_generator.hpp"
#include <algorithm>

namespace MediaOrganizer {

namespace {

void putU32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

uint32_t getU32(const uint8_t* in) {
    return static_cast<uint32_t>(in[0]) |
           (static_cast<uint32_t>(in[1]) << 8) |
           (static_cast<uint32_t>(in[2]) << 16) |
           (static_cast<uint32_t>(in[3]) << 24);
}

} // namespace

ThumbnailImage ThumbnailGenerator::downscale(const uint8_t* rgba, int width, int height, int targetWidth) {
    ThumbnailImage image;
    if (!rgba || width <= 0 || height <= 0) return image;

    if (targetWidth <= 0 || width <= targetWidth) {
        image.width = static_cast<uint32_t>(width);
        image.height = static_cast<uint32_t>(height);
        image.pixels.assign(rgba, rgba + static_cast<size_t>(width) * height * 4);
        return image;
    }

    int outW = targetWidth;
    int outH = std::max(1, static_cast<int>(static_cast<int64_t>(height) * targetWidth / width));
    image.width = static_cast<uint32_t>(outW);
    image.height = static_cast<uint32_t>(outH);
    image.pixels.resize(static_cast<size_t>(outW) * outH * 4);

    // Box filter: average every source pixel that falls inside each output cell
    for (int y = 0; y < outH; ++y) {
        int y0 = static_cast<int>(static_cast<int64_t>(y) * height / outH);
        int y1 = std::max(y0 + 1, static_cast<int>(static_cast<int64_t>(y + 1) * height / outH));
        for (int x = 0; x < outW; ++x) {
            int x0 = static_cast<int>(static_cast<int64_t>(x) * width / outW);
            int x1 = std::max(x0 + 1, static_cast<int>(static_cast<int64_t>(x + 1) * width / outW));

            uint32_t sum[4] = {0, 0, 0, 0};
            for (int sy = y0; sy < y1; ++sy) {
                const uint8_t* row = rgba + (static_cast<size_t>(sy) * width + x0) * 4;
                for (int sx = x0; sx < x1; ++sx, row += 4) {
                    for (int c = 0; c < 4; ++c) sum[c] += row[c];
                }
            }
            uint32_t count = static_cast<uint32_t>((y1 - y0) * (x1 - x0));
            uint8_t* dst = &image.pixels[(static_cast<size_t>(y) * outW + x) * 4];
            for (int c = 0; c < 4; ++c) dst[c] = static_cast<uint8_t>(sum[c] / count);
        }
    }
    return image;
}

std::vector<uint8_t> ThumbnailGenerator::encode(const ThumbnailImage& image) {
    std::vector<uint8_t> payload;
    payload.reserve(8 + image.pixels.size());
    putU32(payload, image.width);
    putU32(payload, image.height);
    payload.insert(payload.end(), image.pixels.begin(), image.pixels.end());
    return payload;
}

std::optional<ThumbnailImage> ThumbnailGenerator::decode(const std::vector<uint8_t>& payload) {
    if (payload.size() < 8) return std::nullopt;

    ThumbnailImage image;
    image.width = getU32(payload.data());
    image.height = getU32(payload.data() + 4);
    size_t expected = static_cast<size_t>(image.width) * image.height * 4;
    if (payload.size() - 8 != expected) return std::nullopt;

    image.pixels.assign(payload.begin() + 8, payload.end());
    return image;
}

} // namespace MediaOrganizer
