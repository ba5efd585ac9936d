#ifndef KNIT_LIBPARSE_TEST_INTERFACE
#define KNIT_LIBPARSE_TEST_INTERFACE

#include <libutl/utilities.hpp>

// Each function parses the entire string and returns either the rendering of the
// parsed node, or the position and message of the parse failure.

namespace knit::par {
    auto test_parse_expression(std::string_view source) -> std::string;
    auto test_parse_pattern(std::string_view source) -> std::string;
    auto test_parse_type(std::string_view source) -> std::string;

    // Renders each declaration on its own line.
    auto test_parse_module(std::string_view source) -> std::string;
} // namespace knit::par

#endif // KNIT_LIBPARSE_TEST_INTERFACE
