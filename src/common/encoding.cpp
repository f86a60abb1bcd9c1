#include "hostgate/common/encoding.hpp"

#include "hostgate/common/fs.hpp"

#include <cerrno>
#include <cstring>
#include <iconv.h>
#include <unordered_map>

namespace hostgate::common {

namespace {

const std::unordered_map<std::string, std::string> &encoding_aliases() {
  static const std::unordered_map<std::string, std::string> aliases = {
      {"utf-8", "UTF-8"},          {"utf8", "UTF-8"},
      {"utf-16", "UTF-16LE"},      {"utf16", "UTF-16LE"},
      {"utf-16le", "UTF-16LE"},    {"unicode", "UTF-16LE"},
      {"utf-16be", "UTF-16BE"},    {"utf-32", "UTF-32LE"},
      {"utf32", "UTF-32LE"},       {"ascii", "ASCII"},
      {"us-ascii", "ASCII"},       {"shift-jis", "SHIFT_JIS"},
      {"shift_jis", "SHIFT_JIS"},  {"sjis", "SHIFT_JIS"},
      {"euc-jp", "EUC-JP"},        {"iso-2022-jp", "ISO-2022-JP"},
      {"latin1", "ISO-8859-1"},    {"iso-8859-1", "ISO-8859-1"},
  };
  return aliases;
}

Result<std::string> convert(const std::string &input, const std::string &from,
                            const std::string &to) {
  if (from == to || input.empty()) {
    return Result<std::string>::success(input);
  }

  iconv_t cd = iconv_open(to.c_str(), from.c_str());
  if (cd == reinterpret_cast<iconv_t>(-1)) {
    return Result<std::string>::failure("Unsupported conversion " + from + " -> " + to,
                                        ErrorCode::Validation);
  }

  std::string output;
  std::string chunk(4096, '\0');
  char *in_ptr = const_cast<char *>(input.data());
  std::size_t in_left = input.size();
  bool flushing = false;

  while (true) {
    char *out_ptr = chunk.data();
    std::size_t out_left = chunk.size();
    const std::size_t rc = flushing ? iconv(cd, nullptr, nullptr, &out_ptr, &out_left)
                                    : iconv(cd, &in_ptr, &in_left, &out_ptr, &out_left);
    output.append(chunk.data(), chunk.size() - out_left);

    if (rc != static_cast<std::size_t>(-1)) {
      if (flushing) {
        break;
      }
      flushing = true;
      continue;
    }
    if (errno == E2BIG) {
      continue;
    }
    const int err = errno;
    iconv_close(cd);
    return Result<std::string>::failure("Invalid " + from + " byte sequence at offset " +
                                            std::to_string(input.size() - in_left) + ": " +
                                            std::strerror(err),
                                        ErrorCode::Validation);
  }

  iconv_close(cd);
  return Result<std::string>::success(std::move(output));
}

} // namespace

std::string canonical_encoding(const std::string &label) {
  const auto it = encoding_aliases().find(to_lower(trim(label)));
  return it == encoding_aliases().end() ? "UTF-8" : it->second;
}

Result<std::string> decode_to_utf8(const std::string &bytes, const std::string &encoding) {
  const std::string from = canonical_encoding(encoding);
  std::string input = bytes;
  // A UTF-8 BOM is dropped so it does not leak into the text.
  if (from == "UTF-8" && starts_with(input, "\xEF\xBB\xBF")) {
    input.erase(0, 3);
  }
  return convert(input, from, "UTF-8");
}

Result<std::string> encode_from_utf8(const std::string &text, const std::string &encoding) {
  return convert(text, "UTF-8", canonical_encoding(encoding));
}

} // namespace hostgate::common
