/**
 * @file describe.hpp
 * @brief Human and machine summaries of a chunk.
 *
 * `describe_pretty()` renders a single `key=value` line that scripts can
 * grep:
 * @code
 *   type=RuSt length=42 crc=2882656334 critical=1 public=0 reserved_ok=1 safe_to_copy=1 valid=1 data="This is where..."
 * @endcode
 * Payloads that are not text, or text holding quotes, backslashes or control
 * characters, are shown as `data_hex=...` instead; a tag that is not text is
 * shown as `type_hex=...`. The summary never fails.
 *
 * `describe_json()` returns the same fields as a JSON object.
 * `describe_error_json()` is the JSON form of `Error::to_string()`.
 */

#ifndef PNGME_DESCRIBE_HPP
#define PNGME_DESCRIBE_HPP

#include "pngme/chunk.hpp"
#include "pngme/error.hpp"
#include "nlohmann/json.hpp"
#include <string>

namespace pngme {

std::string describe_pretty(const Chunk& chunk);

nlohmann::json describe_json(const Chunk& chunk);

nlohmann::json describe_error_json(const Error& err);

} // namespace pngme

#endif // PNGME_DESCRIBE_HPP
