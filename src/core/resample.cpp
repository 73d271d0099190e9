#include "resample.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>
#include <vector>

namespace collager::core {
namespace {

struct Contribution {
    unsigned int first = 0;
    std::vector<float> weights;
};

std::vector<Contribution> compute_contributions(unsigned int src_len, unsigned int dst_len) {
    std::vector<Contribution> out(dst_len);
    const double scale = static_cast<double>(dst_len) / static_cast<double>(src_len);
    const double support = scale < 1.0 ? 1.0 / scale : 1.0;

    for (unsigned int i = 0; i < dst_len; ++i) {
        const double center = (static_cast<double>(i) + 0.5) / scale;
        const auto lo = static_cast<long long>(std::floor(center - support));
        const auto hi = static_cast<long long>(std::ceil(center + support));
        const long long first = std::max<long long>(lo, 0);
        const long long last = std::min<long long>(hi, static_cast<long long>(src_len) - 1);

        Contribution& c = out[i];
        c.first = static_cast<unsigned int>(first);
        double total = 0.0;
        for (long long j = first; j <= last; ++j) {
            const double distance = std::abs((static_cast<double>(j) + 0.5 - center) / support);
            const double weight = std::max(0.0, 1.0 - distance);
            c.weights.push_back(static_cast<float>(weight));
            total += weight;
        }

        if (total <= 0.0) {
            // Degenerate window: fall back to the nearest source sample.
            const auto nearest = static_cast<long long>(std::floor(center));
            c.first = static_cast<unsigned int>(std::clamp<long long>(nearest, 0, static_cast<long long>(src_len) - 1));
            c.weights.assign(1, 1.0F);
            continue;
        }
        for (float& w : c.weights) {
            w = static_cast<float>(w / total);
        }
    }
    return out;
}

} // namespace

Image resample(const Image& src, unsigned int width, unsigned int height) {
    if (width == 0 || height == 0 || src.empty()) {
        return Image{};
    }
    if (width == src.width() && height == src.height()) {
        return src;
    }

    const std::vector<Contribution> horizontal = compute_contributions(src.width(), width);
    const std::vector<Contribution> vertical = compute_contributions(src.height(), height);

    // Premultiplied float intermediate: width x src.height.
    std::vector<std::array<float, k_num_channels>> rows(static_cast<size_t>(width) * src.height());
    for (unsigned int y = 0; y < src.height(); ++y) {
        for (unsigned int x = 0; x < width; ++x) {
            const Contribution& c = horizontal[x];
            std::array<float, k_num_channels> acc{};
            for (size_t k = 0; k < c.weights.size(); ++k) {
                const Color p = src.pixel(c.first + static_cast<unsigned int>(k), y);
                const float a = static_cast<float>(p.a) * c.weights[k];
                acc[k_channel_r] += static_cast<float>(p.r) * a;
                acc[k_channel_g] += static_cast<float>(p.g) * a;
                acc[k_channel_b] += static_cast<float>(p.b) * a;
                acc[k_channel_a] += a;
            }
            rows[(static_cast<size_t>(y) * width) + x] = acc;
        }
    }

    std::vector<unsigned char> out(static_cast<size_t>(width) * height * k_num_channels);
    auto to_byte = [](float v) {
        return static_cast<unsigned char>(std::clamp(v + 0.5F, 0.0F, 255.0F));
    };
    for (unsigned int y = 0; y < height; ++y) {
        const Contribution& c = vertical[y];
        for (unsigned int x = 0; x < width; ++x) {
            std::array<float, k_num_channels> acc{};
            for (size_t k = 0; k < c.weights.size(); ++k) {
                const auto& p = rows[(static_cast<size_t>(c.first + k) * width) + x];
                for (size_t ch = 0; ch < k_num_channels; ++ch) {
                    acc[ch] += p[ch] * c.weights[k];
                }
            }
            const size_t offset = ((static_cast<size_t>(y) * width) + x) * k_num_channels;
            const float alpha = acc[k_channel_a];
            if (alpha > 0.0F) {
                out[offset + k_channel_r] = to_byte(acc[k_channel_r] / alpha);
                out[offset + k_channel_g] = to_byte(acc[k_channel_g] / alpha);
                out[offset + k_channel_b] = to_byte(acc[k_channel_b] / alpha);
            }
            out[offset + k_channel_a] = to_byte(alpha);
        }
    }
    return Image(width, height, std::move(out));
}

} // namespace collager::core
