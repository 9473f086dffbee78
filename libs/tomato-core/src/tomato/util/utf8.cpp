#include <tomato/util/utf8.hpp>

namespace tomato::util {

size_t TruncatedUTF8Length(std::string_view text, size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text.size();
    }

    // Back up while the first excluded byte is a continuation byte (10xxxxxx)
    size_t len = maxBytes;
    while (len > 0 && (static_cast<unsigned char>(text[len]) & 0xC0) == 0x80) {
        --len;
    }
    return len;
}

} // namespace tomato::util
