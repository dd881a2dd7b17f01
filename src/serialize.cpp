#include "maybe/serialize.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

#include "maybe/error_channel.hpp"

namespace maybe {

    namespace {

        constexpr std::array<std::string_view, 3> kLiterals = {"true", "false", "null"};

        bool is_digit(std::string_view text, std::size_t i) {
            return i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0;
        }

        std::size_t skip_digits(std::string_view text, std::size_t i) {
            while (is_digit(text, i)) {
                ++i;
            }
            return i;
        }

        // Each scanner returns the end of the token starting at `start`. A token the
        // lexer rejects extends one past the offending byte.
        std::size_t scan_number(std::string_view text, std::size_t start) {
            std::size_t i = start;
            if (text[i] == '-') {
                ++i;
            }
            if (!is_digit(text, i)) {
                return i + 1;
            }
            i = text[i] == '0' ? i + 1 : skip_digits(text, i);
            if (i < text.size() && text[i] == '.') {
                if (!is_digit(text, ++i)) {
                    return i + 1;
                }
                i = skip_digits(text, i);
            }
            if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
                ++i;
                if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
                    ++i;
                }
                if (!is_digit(text, i)) {
                    return i + 1;
                }
                i = skip_digits(text, i);
            }
            return i;
        }

        std::size_t scan_string(std::string_view text, std::size_t start) {
            for (std::size_t i = start + 1; i < text.size(); ++i) {
                if (text[i] == '\\') {
                    ++i;
                } else if (text[i] == '"') {
                    return i + 1;
                }
            }
            return text.size() + 1;
        }

        std::size_t scan_literal(std::string_view text, std::size_t start) {
            for (const auto literal : kLiterals) {
                if (literal.front() != text[start]) {
                    continue;
                }
                for (std::size_t k = 1; k < literal.size(); ++k) {
                    if (start + k >= text.size() || text[start + k] != literal[k]) {
                        return start + k + 1;
                    }
                }
                return start + literal.size();
            }
            return start + 1;
        }

        bool is_whitespace(char ch) {
            return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
        }

        // Start of the token that holds byte `failed`, the one the parser stopped on.
        std::size_t token_offset(std::string_view text, std::size_t failed) {
            std::size_t i = 0;
            while (i < text.size()) {
                if (is_whitespace(text[i])) {
                    ++i;
                    continue;
                }
                const char  ch  = text[i];
                std::size_t end = i + 1;
                if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) {
                    end = scan_number(text, i);
                } else if (ch == '"') {
                    end = scan_string(text, i);
                } else if (ch == 't' || ch == 'f' || ch == 'n') {
                    end = scan_literal(text, i);
                }
                if (failed < end) {
                    return i;
                }
                i = end;
            }
            return std::min(failed, text.size());
        }

    } // namespace

    std::string serialize(const Value& value) {
        return value.dump();
    }

    Value unserialize(std::string_view text) {
        try {
            return Value::parse(text);
        } catch (const nlohmann::json::parse_error& ex) {
            const auto offset = token_offset(text, ex.byte > 0 ? ex.byte - 1 : 0);
            report_error(Severity::kNotice, "unserialize(): Error at offset " + std::to_string(offset) + " of " + std::to_string(text.size()) + " bytes",
                         Value{{"offset", offset}, {"size", text.size()}, {"reason", ex.what()}});
            return Value(false);
        }
    }

} // namespace maybe
