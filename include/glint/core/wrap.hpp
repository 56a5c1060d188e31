#ifndef GLINT_CORE_WRAP_HPP
#define GLINT_CORE_WRAP_HPP

#include "string_utils.hpp"
#include "utf8.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace glint::core {

    struct WrapOptions {
        std::size_t width{80};
        std::string_view initial_indent{};
        std::string_view subsequent_indent{};
    };

    /**
     * @brief Greedy word wrap. Explicit newlines are kept, a word longer than
     *        the available width is put on a line of its own.
     * @return wrapped lines without trailing newlines; the first line carries
     *         `initial_indent` and every following line `subsequent_indent`.
     */
    static inline auto wrap_text(std::string_view text, WrapOptions const& options) -> std::vector<std::string> {
        auto res = std::vector<std::string>{};
        auto first = true;

        for (auto paragraph: utils::split_lines(text)) {
            auto const indent = first ? options.initial_indent : options.subsequent_indent;
            auto current = std::string(indent);
            auto used = utf8::display_width(indent);
            auto has_word = false;

            auto start = 0zu;
            while (start <= paragraph.size()) {
                auto pos = paragraph.find(' ', start);
                if (pos == std::string_view::npos) pos = paragraph.size();
                auto word = paragraph.substr(start, pos - start);
                start = pos + 1;
                if (word.empty()) continue;

                auto const word_width = utf8::display_width(word);
                if (has_word && used + 1 + word_width > options.width) {
                    res.push_back(std::move(current));
                    current = std::string(options.subsequent_indent);
                    used = utf8::display_width(options.subsequent_indent);
                    has_word = false;
                }

                if (has_word) {
                    current += ' ';
                    ++used;
                }
                current += word;
                used += word_width;
                has_word = true;
            }

            res.push_back(std::move(current));
            first = false;
        }

        return res;
    }

    static inline auto fill_text(std::string_view text, WrapOptions const& options) -> std::string {
        auto lines = wrap_text(text, options);
        auto res = std::string();
        for (auto i = 0zu; i < lines.size(); ++i) {
            if (i != 0) res += '\n';
            res += lines[i];
        }
        return res;
    }

} // namespace glint::core

#endif // GLINT_CORE_WRAP_HPP
