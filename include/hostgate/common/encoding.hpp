#pragma once

#include "hostgate/common/result.hpp"

#include <string>

namespace hostgate::common {

/// iconv name for a user-facing encoding label. Unknown or empty labels map to "UTF-8".
[[nodiscard]] std::string canonical_encoding(const std::string &label);

/// `bytes` in `encoding` -> UTF-8.
[[nodiscard]] Result<std::string> decode_to_utf8(const std::string &bytes,
                                                 const std::string &encoding);
/// UTF-8 `text` -> bytes in `encoding`.
[[nodiscard]] Result<std::string> encode_from_utf8(const std::string &text,
                                                   const std::string &encoding);

} // namespace hostgate::common
