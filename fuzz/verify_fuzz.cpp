#include <jsonvfy/jsonvfy.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

// Verifies each input with several buffer sizes; every size must agree.
// invariant_violation is not caught, so a state machine bug crashes the run.
extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data, std::size_t size) {
  const std::string_view input(reinterpret_cast<const char*>(data), size);

  jsonvfy::verify_options opt;
  opt.buffer_size = 1;
  const jsonvfy::verify_result tiny = jsonvfy::verify_detailed(input, opt);
  opt.buffer_size = 7;
  const jsonvfy::verify_result small = jsonvfy::verify_detailed(input, opt);
  opt.buffer_size = JSONVFY_DEFAULT_BUFFER_SIZE;
  const jsonvfy::verify_result large = jsonvfy::verify_detailed(input, opt);

  if (tiny.valid != large.valid || small.valid != large.valid) std::abort();
  if (tiny.err.code != large.err.code || tiny.err.offset != large.err.offset) std::abort();

  // Accepted documents also pass the stricter mode unless a value string is bad.
  if (large.valid) {
    opt.validate_value_strings = true;
    const jsonvfy::verify_result strict = jsonvfy::verify_detailed(input, opt);
    if (!strict.valid && strict.err.code != jsonvfy::error_code::invalid_utf8_sequence &&
        strict.err.code != jsonvfy::error_code::utf8_sequence_produced_surrogate &&
        strict.err.code != jsonvfy::error_code::invalid_utf16_surrogate_sequence) {
      std::abort();
    }
  }
  return 0;
}
