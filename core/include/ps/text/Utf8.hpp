#pragma once
#include <string>

namespace ps {

// Decode UTF-8 into Unicode scalar values. Malformed or truncated sequences,
// overlong forms and surrogates decode to U+FFFD.
std::u32string decodeUtf8(const std::string& s);

// Encode scalar values as UTF-8. Values that are not scalars encode as U+FFFD.
std::string encodeUtf8(const std::u32string& s);

} // namespace ps
