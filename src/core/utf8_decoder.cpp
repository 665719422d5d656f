#include "utf8_decoder.hpp"

std::string Utf8Decoder::feed(const char* data, size_t len) {
    std::string input;
    input.reserve(pending_.size() + len);
    input.append(pending_);
    input.append(data, len);
    pending_.clear();

    std::string out;
    out.reserve(input.size());

    const size_t n = input.size();
    size_t i = 0;
    while (i < n) {
        unsigned char b = static_cast<unsigned char>(input[i]);
        if (b < 0x80) {
            out += static_cast<char>(b);
            ++i;
            continue;
        }

        // Continuation count plus the allowed range of the second byte
        // (rules out overlongs, surrogates and code points above U+10FFFF).
        int need;
        unsigned char lo = 0x80, hi = 0xBF;
        if (b >= 0xC2 && b <= 0xDF) {
            need = 1;
        } else if (b >= 0xE0 && b <= 0xEF) {
            need = 2;
            if (b == 0xE0) lo = 0xA0;
            if (b == 0xED) hi = 0x9F;
        } else if (b >= 0xF0 && b <= 0xF4) {
            need = 3;
            if (b == 0xF0) lo = 0x90;
            if (b == 0xF4) hi = 0x8F;
        } else {
            out += replacement();
            ++i;
            continue;
        }

        size_t j = i + 1;
        bool truncated = false;
        bool valid = true;
        for (int k = 0; k < need; ++k, ++j) {
            if (j >= n) {
                truncated = true;
                break;
            }
            unsigned char c = static_cast<unsigned char>(input[j]);
            if (c < lo || c > hi) {
                valid = false;
                break;
            }
            lo = 0x80;
            hi = 0xBF;
        }

        if (truncated) {
            // Wait for the rest of the character
            pending_ = input.substr(i);
            break;
        }
        if (!valid) {
            // Replace the consumed prefix; the offending byte is re-examined
            out += replacement();
            i = j;
            continue;
        }

        out.append(input, i, j - i);
        i = j;
    }

    return out;
}

std::string Utf8Decoder::flush() {
    if (pending_.empty()) return "";
    pending_.clear();
    return replacement();
}
