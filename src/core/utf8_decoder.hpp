#pragma once

#include <string>
#include <cstddef>

// Incremental UTF-8 decoder for a byte stream that arrives in arbitrary pieces.
//
// Output is always valid UTF-8. Each maximal ill-formed subsequence becomes
// one U+FFFD. A character split across two reads is held back until the rest
// arrives instead of being replaced.
class Utf8Decoder {
public:
    // Decode the next piece of the stream.
    std::string feed(const char* data, size_t len);
    std::string feed(const std::string& data) { return feed(data.data(), data.size()); }

    // End of stream: a dangling partial character becomes U+FFFD.
    std::string flush();

    bool has_pending() const { return !pending_.empty(); }

    static const char* replacement() { return "\xEF\xBF\xBD"; }

private:
    std::string pending_;   // incomplete trailing sequence (at most 3 bytes)
};
