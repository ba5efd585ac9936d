#ifndef KNIT_LIBUTL_UTILITIES
#define KNIT_LIBUTL_UTILITIES

// This file is intended to be used as a precompiled header across the entire project.

#include <cpputil/util.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <numeric>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

// Literal operators are useless when not easily accessible, so it is best to
// make them available everywhere. There is no risk of name collision because
// the standard reserves literal operators that do not begin with an underscore.
using namespace std::literals; // NOLINT

namespace knit::utl {

    template <std::size_t length>
    struct Metastring {
        std::array<char, length> array;

        consteval Metastring(char const (&string)[length]) // NOLINT
        {
            std::copy_n(static_cast<char const*>(string), length, array.data());
        }

        [[nodiscard]] consteval auto view() const noexcept -> std::string_view
        {
            return std::string_view(array.data(), length - 1);
        }
    };

    template <typename... Fs>
    struct Overload : Fs... {
        using Fs::operator()...;
    };

    // Join the formatted elements of `range` with `delimiter`.
    template <std::ranges::input_range Range>
    [[nodiscard]] auto join(Range const& range, std::string_view const delimiter) -> std::string
    {
        std::string output;
        bool        first = true;
        for (auto const& element : range) {
            if (not std::exchange(first, false)) {
                output.append(delimiter);
            }
            std::format_to(std::back_inserter(output), "{}", element);
        }
        return output;
    }

    // Escape control characters and quotes so that `string` can be shown on one line.
    [[nodiscard]] auto escape(std::string_view string) -> std::string;

} // namespace knit::utl

#endif // KNIT_LIBUTL_UTILITIES
