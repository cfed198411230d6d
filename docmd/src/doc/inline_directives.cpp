//! # Inline Directive Parser Implementation
//!
//! A recursive-descent scanner over a single cursor:
//!
//! ```text
//! text  := (inner | '}')*
//! inner := (block | char - '{' - '}')*
//! block := '{' ('@' name ' '?)? inner '}'
//! ```

#include "doc/inline_directives.hpp"

#include "log/log.hpp"

#include <cctype>
#include <optional>

namespace docmd::doc {

namespace {

class DirectiveParser {
public:
    DirectiveParser(std::string_view input, size_t max_depth, DirectiveTarget target)
        : input_(input), max_depth_(max_depth), target_(target) {
        out_.reserve(input.size());
    }

    auto run() -> Result<std::string, DirectiveError> {
        while (!at_end()) {
            if (!parse_inner(0)) {
                return *error_;
            }
            // A closing brace with no opener is ordinary text at top level.
            if (!at_end() && peek() == '}') {
                out_ += '}';
                ++pos_;
            }
        }
        return std::move(out_);
    }

private:
    std::string_view input_;
    size_t max_depth_;
    DirectiveTarget target_;
    size_t escape_depth_ = 0; ///< Nesting of directives whose output is escaped.
    size_t pos_ = 0;
    std::string out_;
    std::optional<DirectiveError> error_;

    auto at_end() const -> bool {
        return pos_ >= input_.size();
    }

    auto peek() const -> char {
        return input_[pos_];
    }

    void emit(std::string_view text) {
        if (escape_depth_ == 0) {
            out_ += text;
            return;
        }
        for (char c : text) {
            switch (c) {
            case '<':
                out_ += "&lt;";
                break;
            case '>':
                out_ += "&gt;";
                break;
            case '&':
                out_ += "&amp;";
                break;
            default:
                out_ += c;
            }
        }
    }

    /// Opens the markup wrapper around the outermost recognized directive.
    void begin_directive_output() {
        if (target_ == DirectiveTarget::Markup && escape_depth_++ == 0) {
            out_ += '<';
            out_ += DIRECTIVE_MARKDOWN_TAG;
            out_ += '>';
        }
    }

    void end_directive_output() {
        if (target_ == DirectiveTarget::Markup && --escape_depth_ == 0) {
            out_ += "</";
            out_ += DIRECTIVE_MARKDOWN_TAG;
            out_ += '>';
        }
    }

    auto fail(std::string message) -> bool {
        error_ = DirectiveError{std::move(message), pos_};
        return false;
    }

    auto expect(char expected) -> bool {
        if (at_end()) {
            return fail(std::string("want `") + expected + "` got end of input");
        }
        if (peek() != expected) {
            return fail(std::string("want `") + expected + "` got `" + peek() + "`");
        }
        ++pos_;
        return true;
    }

    auto parse_name() -> std::string {
        size_t start = pos_;
        while (!at_end() && std::isalpha(static_cast<unsigned char>(peek()))) {
            ++pos_;
        }
        return std::string(input_.substr(start, pos_ - start));
    }

    auto parse_block(size_t depth) -> bool {
        if (depth > max_depth_) {
            return fail("brace nesting deeper than " + std::to_string(max_depth_));
        }
        if (!expect('{')) {
            return false;
        }

        if (!at_end() && peek() == '@') {
            size_t name_pos = pos_;
            ++pos_;
            auto name = parse_name();
            if (!at_end() && peek() == ' ') {
                ++pos_;
            }

            if (name == "code" || name == "link" || name == "linkplain") {
                begin_directive_output();
                out_ += '`';
                if (!parse_inner(depth)) {
                    return false;
                }
                out_ += '`';
                end_directive_output();
            } else if (name == "literal") {
                begin_directive_output();
                if (!parse_inner(depth)) {
                    return false;
                }
                end_directive_output();
            } else {
                DOCMD_LOG_DEBUG("directive",
                                "Unknown directive `@" << name << "` at offset " << name_pos);
                if (!parse_inner(depth)) {
                    return false;
                }
            }
        } else if (!parse_inner(depth)) {
            return false;
        }

        return expect('}');
    }

    /// Copies text and nested blocks up to (not including) the first
    /// unmatched `}` or the end of input.
    auto parse_inner(size_t depth) -> bool {
        while (!at_end()) {
            auto brace = input_.find_first_of("{}", pos_);
            if (brace == std::string_view::npos) {
                emit(input_.substr(pos_));
                pos_ = input_.size();
                return true;
            }
            emit(input_.substr(pos_, brace - pos_));
            pos_ = brace;

            if (peek() == '}') {
                return true;
            }
            if (!parse_block(depth + 1)) {
                return false;
            }
        }
        return true;
    }
};

} // namespace

auto parse_inline_directives(std::string_view text, const RenderOptions& options,
                             DirectiveTarget target) -> Result<std::string, DirectiveError> {
    if (text.find('{') == std::string_view::npos) {
        return std::string(text);
    }
    DirectiveParser parser(text, options.max_directive_depth, target);
    return parser.run();
}

auto replace_inline_directives(std::string_view text, const RenderOptions& options,
                               DirectiveTarget target) -> std::string {
    auto result = parse_inline_directives(text, options, target);
    if (is_err(result)) {
        const auto& err = unwrap_err(result);
        DOCMD_LOG_DEBUG("directive", "Keeping text unchanged: " << err.message << " at offset "
                                                                << err.position);
        return std::string(text);
    }
    return std::move(unwrap(result));
}

} // namespace docmd::doc
