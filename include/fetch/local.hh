#ifndef FETCH_LOCAL_HH
#define FETCH_LOCAL_HH

#include "errors.hh"
#include "utils.hh"

#include <string>
#include <string_view>

namespace fetch {
/// Decode the part of a data: locator after "data:".
///
/// Everything up to the first comma is the media type; the rest is the
/// payload, which is percent-decoded and, if the media type ends in
/// ;base64, base64-decoded. Without a comma the result is empty.
///
/// \throw decode_error If an escape or the base64 payload is malformed.
[[nodiscard]] std::string load_data(std::string_view contents);

/// Replace %XX escapes with the bytes they stand for.
///
/// \throw decode_error If a % isn’t followed by two hex digits.
[[nodiscard]] std::string percent_decode(std::string_view text);

/// Decode standard base64. Whitespace is ignored.
///
/// \throw decode_error If the input isn’t valid base64.
[[nodiscard]] std::string base64_decode(std::string_view text);

/// Read a whole file.
///
/// \throw file_read_error If the file can’t be opened or read.
[[nodiscard]] std::string read_file(std::string_view path);
} // namespace fetch

#endif // FETCH_LOCAL_HH
