// fuzz_number.cpp – libFuzzer target for the numscan scan/resolve/encode path.
//
// Checks the properties a tape builder relies on for arbitrary bytes:
//   * the scanner never reports an extent past the buffer,
//   * resolution is deterministic (two calls, identical words),
//   * the (0, 0) sentinel and the typed API agree,
//   * every non-sentinel pair decodes back to the same number.
//
// Build:
//   cmake -B build-fuzz \
//         -DNUMSCAN_BUILD_FUZZ=ON \
//         -DNUMSCAN_BUILD_TESTS=OFF \
//         -DCMAKE_CXX_COMPILER=clang++
//   cmake --build build-fuzz --target fuzz_number
//
// Run (indefinitely):
//   ./build-fuzz/fuzz/fuzz_number -max_len=64

#include <numscan/numscan.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

using namespace numscan;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const std::string_view input(reinterpret_cast<const char *>(data), size);

    // ── 1. Extent stays inside the buffer ────────────────────────────────────
    const ScanResult s = scan(input);
    if (s.extent > size)
        std::abort();

    // ── 2. Deterministic encoding ────────────────────────────────────────────
    const tape::Words a = tape::parse_number(input);
    const tape::Words b = tape::parse_number(input);
    if (!(a == b))
        std::abort();

    // ── 3. Sentinel <=> nullopt ──────────────────────────────────────────────
    const auto typed = try_parse_number(input);
    if (typed.has_value() == a.is_end())
        std::abort();

    // ── 4. decode(encode(x)) == x ────────────────────────────────────────────
    if (typed) {
        const auto back = tape::decode(a);
        if (!back || !(*back == *typed))
            std::abort();
    }

    // ── 5. Stricter options only ever reject ─────────────────────────────────
    NumberOptions strict;
    strict.allow_uint64 = false;
    strict.allow_overflowed_integers = false;
    strict.allow_float_underflow = false;
    const auto narrowed = try_parse_number(input, strict);
    if (narrowed && !typed)
        std::abort();

    return 0;
}
