#include "coco_tools/rle.hpp"
#include "coco_tools/errors.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <limits>
#include <string>

namespace coco_tools {

uint64_t RleCodec::totalCount(const Rle& rle) {
    uint64_t total = 0;
    for (uint32_t c : rle.counts) total += c;
    return total;
}

uint64_t RleCodec::pixelCount(const Rle& rle) {
    uint64_t area = 0;
    for (size_t i = 1; i < rle.counts.size(); i += 2) area += rle.counts[i];
    return area;
}

cv::Mat RleCodec::decode(const Rle& rle) {
    const uint64_t expected = static_cast<uint64_t>(rle.height) * rle.width;
    if (rle.height <= 0 || rle.width <= 0 || totalCount(rle) != expected) {
        throw MalformedInput("RLE counts do not cover a " + std::to_string(rle.height) +
                             "x" + std::to_string(rle.width) + " mask");
    }

    // Runs are laid out column by column: fill a w x h buffer row-major,
    // then transpose into the h x w image.
    cv::Mat columns(rle.width, rle.height, CV_8U);
    uint8_t* dst = columns.ptr<uint8_t>();
    uint8_t value = 0;
    size_t offset = 0;
    for (uint32_t run : rle.counts) {
        std::fill(dst + offset, dst + offset + run, value);
        offset += run;
        value = static_cast<uint8_t>(1 - value);
    }

    cv::Mat mask;
    cv::transpose(columns, mask);
    return mask;
}

Rle RleCodec::encode(const cv::Mat& mask, bool compressed) {
    CV_Assert(mask.type() == CV_8U);

    cv::Mat columns;
    cv::transpose(mask, columns);
    if (!columns.isContinuous()) columns = columns.clone();

    Rle rle;
    rle.height = mask.rows;
    rle.width = mask.cols;
    rle.compressed = compressed;

    const uint8_t* src = columns.ptr<uint8_t>();
    const size_t n = columns.total();
    uint8_t current = 0;
    uint32_t run = 0;
    for (size_t i = 0; i < n; ++i) {
        const uint8_t v = src[i] ? 1 : 0;
        if (v != current) {
            rle.counts.push_back(run);
            run = 0;
            current = v;
        }
        ++run;
    }
    rle.counts.push_back(run);
    return rle;
}

std::string RleCodec::toString(const std::vector<uint32_t>& counts) {
    std::string s;
    s.reserve(counts.size() * 2);
    for (size_t i = 0; i < counts.size(); ++i) {
        int64_t x = counts[i];
        if (i > 2) x -= static_cast<int64_t>(counts[i - 2]);
        bool more = true;
        while (more) {
            char c = static_cast<char>(x & 0x1f);
            x >>= 5;
            more = (c & 0x10) ? x != -1 : x != 0;
            if (more) c |= 0x20;
            s.push_back(static_cast<char>(c + 48));
        }
    }
    return s;
}

bool RleCodec::fromString(const std::string& s, std::vector<uint32_t>& counts) {
    counts.clear();
    size_t p = 0;
    while (p < s.size()) {
        int64_t x = 0;
        int k = 0;
        bool more = true;
        while (more) {
            // Runs are 32-bit: seven 5-bit groups cover any run or delta.
            if (p >= s.size() || k >= 7) return false;
            const int c = static_cast<unsigned char>(s[p]) - 48;
            if (c < 0 || c > 0x3f) return false;
            x |= static_cast<int64_t>(c & 0x1f) << (5 * k);
            more = (c & 0x20) != 0;
            ++p;
            ++k;
            if (!more && (c & 0x10)) x |= -(static_cast<int64_t>(1) << (5 * k));
        }
        if (counts.size() > 2) x += counts[counts.size() - 2];
        if (x < 0 || x > std::numeric_limits<uint32_t>::max()) return false;
        counts.push_back(static_cast<uint32_t>(x));
    }
    return true;
}

Rle RleCodec::resize(const Rle& rle, int width, int height) {
    cv::Mat mask = decode(rle);
    cv::Mat resized;
    cv::resize(mask, resized, cv::Size(width, height), 0, 0, cv::INTER_NEAREST);
    return encode(resized, rle.compressed);
}

} // namespace coco_tools
