#ifndef GLINT_ERROR_HPP
#define GLINT_ERROR_HPP

#include <cstdint>
#include <format>
#include <string_view>
#include <utility>

namespace glint {

    enum class SpanError: std::uint8_t {
        OutOfBounds
    };

    constexpr auto to_string(SpanError e) noexcept -> std::string_view {
        switch (e) {
            case SpanError::OutOfBounds: return "OutOfBounds";
        }
        std::unreachable();
    }

} // namespace glint

template <>
struct std::formatter<glint::SpanError> {
    constexpr auto parse(auto& ctx) {
        auto it = ctx.begin();
        while (it != ctx.end()) {
            if (*it == '}') break;
            ++it;
        }
        return it;
    }

    auto format(glint::SpanError const& e, auto& ctx) const {
        return std::format_to(ctx.out(), "{}", glint::to_string(e));
    }
};

#endif // GLINT_ERROR_HPP
