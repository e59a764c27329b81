/**
 * @file main.cpp
 * @brief pngme-chunk: build or inspect a single PNG chunk frame from the shell.
 *
 * Responsibilities:
 *  - `encode`: turn a type + message into a chunk, print its summary and the
 *    wire bytes as hex.
 *  - `decode`: parse a hex frame, print the summary, or the exact reason it
 *    was rejected.
 *  - `--format pretty|json` chooses between a key=value line and JSON.
 *
 * Examples:
 * @code
 *   pngme-chunk encode --type RuSt --message "hello"
 *   pngme-chunk decode --hex 0000000552755374...
 *   pngme-chunk --format json decode --hex "00 00 00 05 52 75 53 74 ..."
 * @endcode
 *
 * Notes:
 *  - Errors go to stderr as `status=error reason=<kind> ...`; exit code 2.
 *  - Usage errors are reported by CLI11 itself (exit code from CLI11_PARSE).
 */

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "pngme/chunk.hpp"
#include "pngme/chunk_type.hpp"
#include "pngme/describe.hpp"
#include "pngme/error.hpp"
#include "pngme/text.hpp"

using json = nlohmann::json;
using namespace pngme;

static int fail(const Error& err, const std::string& format) {
  if (format == "json") {
    std::cerr << describe_error_json(err).dump(2) << "\n";
  } else {
    std::cerr << err.to_string() << "\n";
  }
  return 2;
}

static void print_chunk(const Chunk& chunk, const std::string& format, bool with_hex) {
  if (format == "json") {
    json j = describe_json(chunk);
    if (with_hex) j["hex"] = to_hex_string(chunk.as_bytes());
    std::cout << j.dump(2) << "\n";
    return;
  }
  std::cout << "status=ok " << describe_pretty(chunk) << "\n";
  if (with_hex) std::cout << "hex=" << to_hex_string(chunk.as_bytes()) << "\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_format = "pretty"; // pretty|json

  CLI::App app{"pngme chunk encoder/decoder"};
  app.require_subcommand(1);
  app.add_option("--format", opt_format, "Output format")
      ->check(CLI::IsMember({"pretty", "json"}));

  // Subcommand: encode
  std::string opt_type;
  std::string opt_message;
  auto cmd_encode = app.add_subcommand("encode", "Build a chunk from a type and a message");
  cmd_encode->add_option("--type", opt_type, "4-letter chunk type (e.g., RuSt)")->required();
  cmd_encode->add_option("--message", opt_message, "Payload text")->required();

  // Subcommand: decode
  std::string opt_hex;
  auto cmd_decode = app.add_subcommand("decode", "Parse a chunk frame given as hex");
  cmd_decode->add_option("--hex", opt_hex, "Frame bytes as hex (0x prefix and spaces allowed)")->required();

  CLI11_PARSE(app, argc, argv);

  if (*cmd_encode) {
    Error err;
    auto type = ChunkType::from_string(opt_type, &err);
    if (!type) return fail(err, opt_format);

    Chunk chunk(*type, std::vector<uint8_t>(opt_message.begin(), opt_message.end()));
    print_chunk(chunk, opt_format, true);
    return 0;
  }

  if (*cmd_decode) {
    Error err;
    std::vector<uint8_t> frame;
    if (!hex_to_bytes(opt_hex, frame, &err)) return fail(err, opt_format);

    auto chunk = Chunk::from_bytes(frame, &err);
    if (!chunk) return fail(err, opt_format);

    print_chunk(*chunk, opt_format, false);
    return 0;
  }

  return 0;
}
