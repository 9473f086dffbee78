#pragma once

#include <cstddef>
#include <string_view>

namespace tomato::util {

// Length in bytes of the longest prefix of text that fits in maxBytes without splitting a UTF-8 sequence.
size_t TruncatedUTF8Length(std::string_view text, size_t maxBytes);

} // namespace tomato::util
