#include "json_utils.hpp"

#include <simdjson.h>

#include <array>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <utility>

#include "constants.hpp"

namespace json_utils {
    namespace {
        const size_t DOUBLE_BUFFER_SIZE = 32;
        const size_t UNICODE_ESCAPE_SIZE = 7;  // \u00XX plus terminator
        const unsigned char FIRST_PRINTABLE = 0x20;

        void append_indent(std::string& out, int depth) { out.append(static_cast<size_t>(depth * constants::JSON_INDENT), ' '); }

        void write_element(std::string& out, simdjson::dom::element element, int depth);

        void write_array(std::string& out, simdjson::dom::array array, int depth) {
            if (array.size() == 0) {
                out += "[]";
                return;
            }

            out += "[\n";
            bool first = true;
            for (simdjson::dom::element child : array) {
                if (!first) {
                    out += ",\n";
                }
                first = false;
                append_indent(out, depth + 1);
                write_element(out, child, depth + 1);
            }
            out += '\n';
            append_indent(out, depth);
            out += ']';
        }

        void write_object(std::string& out, simdjson::dom::object object, int depth) {
            // std::map gives byte-wise key order; a repeated key keeps its last value.
            std::map<std::string_view, simdjson::dom::element> sorted;
            for (simdjson::dom::key_value_pair field : object) {
                sorted.insert_or_assign(field.key, field.value);
            }

            if (sorted.empty()) {
                out += "{}";
                return;
            }

            out += "{\n";
            bool first = true;
            for (const auto& [key, value] : sorted) {
                if (!first) {
                    out += ",\n";
                }
                first = false;
                append_indent(out, depth + 1);
                out += '"';
                append_escaped(out, key);
                out += "\": ";
                write_element(out, value, depth + 1);
            }
            out += '\n';
            append_indent(out, depth);
            out += '}';
        }

        void write_element(std::string& out, simdjson::dom::element element, int depth) {
            switch (element.type()) {
                case simdjson::dom::element_type::OBJECT:
                    write_object(out, simdjson::dom::object(element), depth);
                    break;
                case simdjson::dom::element_type::ARRAY:
                    write_array(out, simdjson::dom::array(element), depth);
                    break;
                case simdjson::dom::element_type::STRING:
                    out += '"';
                    append_escaped(out, std::string_view(element));
                    out += '"';
                    break;
                case simdjson::dom::element_type::INT64:
                    out += std::to_string(int64_t(element));
                    break;
                case simdjson::dom::element_type::UINT64:
                    out += std::to_string(uint64_t(element));
                    break;
                case simdjson::dom::element_type::DOUBLE:
                    out += format_double(double(element));
                    break;
                case simdjson::dom::element_type::BOOL:
                    out += bool(element) ? "true" : "false";
                    break;
                case simdjson::dom::element_type::NULL_VALUE:
                    out += "null";
                    break;
            }
        }

        // On-demand walk, used when the DOM parser rejects an integer outside 64 bits.
        // Values are forward-only, so children are rendered to strings before sorting.
        template <typename Value>
        void write_streamed(std::string& out, Value& value, int depth) {
            const simdjson::ondemand::json_type type = value.type();
            switch (type) {
                case simdjson::ondemand::json_type::object: {
                    std::map<std::string, std::string> sorted;
                    for (auto field : value.get_object()) {
                        const std::string_view key = field.unescaped_key();
                        simdjson::ondemand::value child = field.value();
                        std::string rendered;
                        write_streamed(rendered, child, depth + 1);
                        sorted.insert_or_assign(std::string(key), std::move(rendered));
                    }
                    if (sorted.empty()) {
                        out += "{}";
                        return;
                    }
                    out += "{\n";
                    bool first = true;
                    for (const auto& [key, rendered] : sorted) {
                        if (!first) {
                            out += ",\n";
                        }
                        first = false;
                        append_indent(out, depth + 1);
                        out += '"';
                        append_escaped(out, key);
                        out += "\": ";
                        out += rendered;
                    }
                    out += '\n';
                    append_indent(out, depth);
                    out += '}';
                    return;
                }
                case simdjson::ondemand::json_type::array: {
                    std::vector<std::string> items;
                    for (auto element : value.get_array()) {
                        simdjson::ondemand::value child = std::move(element);
                        std::string rendered;
                        write_streamed(rendered, child, depth + 1);
                        items.push_back(std::move(rendered));
                    }
                    if (items.empty()) {
                        out += "[]";
                        return;
                    }
                    out += "[\n";
                    for (size_t i = 0; i < items.size(); ++i) {
                        if (i > 0) {
                            out += ",\n";
                        }
                        append_indent(out, depth + 1);
                        out += items[i];
                    }
                    out += '\n';
                    append_indent(out, depth);
                    out += ']';
                    return;
                }
                case simdjson::ondemand::json_type::string: {
                    const std::string_view text = value.get_string();
                    out += '"';
                    append_escaped(out, text);
                    out += '"';
                    return;
                }
                case simdjson::ondemand::json_type::number: {
                    const simdjson::ondemand::number_type kind = value.get_number_type();
                    if (kind == simdjson::ondemand::number_type::signed_integer) {
                        out += std::to_string(int64_t(value.get_int64()));
                    } else if (kind == simdjson::ondemand::number_type::unsigned_integer) {
                        out += std::to_string(uint64_t(value.get_uint64()));
                    } else {
                        // big_integer lands here too, widened to a double.
                        out += format_double(double(value.get_double()));
                    }
                    return;
                }
                case simdjson::ondemand::json_type::boolean:
                    out += bool(value.get_bool()) ? "true" : "false";
                    return;
                case simdjson::ondemand::json_type::null:
                    out += "null";
                    return;
                default:
                    throw simdjson::simdjson_error(simdjson::INCORRECT_TYPE);
            }
        }

        std::optional<std::string> to_sorted_pretty_json_streamed(std::string_view text) {
            try {
                simdjson::ondemand::parser parser;
                simdjson::padded_string json(text);
                simdjson::ondemand::document doc = parser.iterate(json);

                std::string out;
                out.reserve(text.size() * 2);
                write_streamed(out, doc, 0);
                if (!doc.at_end()) {
                    return std::nullopt;
                }
                return out;
            } catch (const simdjson::simdjson_error&) {
                return std::nullopt;
            }
        }
    }  // namespace

    bool is_valid_json(std::string_view text) {
        simdjson::dom::parser parser;
        simdjson::padded_string json(text);
        simdjson::dom::element doc;
        const auto error = parser.parse(json).get(doc);
        if (error == simdjson::BIGINT_ERROR) {
            return to_sorted_pretty_json_streamed(text).has_value();
        }
        return error == simdjson::SUCCESS;
    }

    std::optional<std::string> to_sorted_pretty_json(std::string_view text) {
        simdjson::dom::parser parser;
        simdjson::padded_string json(text);
        simdjson::dom::element doc;

        const auto error = parser.parse(json).get(doc);
        if (error == simdjson::BIGINT_ERROR) {
            return to_sorted_pretty_json_streamed(text);
        }
        if (error != simdjson::SUCCESS) {
            return std::nullopt;
        }

        std::string out;
        out.reserve(text.size() * 2);
        write_element(out, doc, 0);
        return out;
    }

    void append_escaped(std::string& out, std::string_view s) {
        for (const char c : s) {
            switch (c) {
                case '"':
                    out += "\\\"";
                    break;
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                case '\b':
                    out += "\\b";
                    break;
                case '\f':
                    out += "\\f";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < FIRST_PRINTABLE) {
                        std::array<char, UNICODE_ESCAPE_SIZE> buf{};
                        std::snprintf(buf.data(), buf.size(), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                        out += buf.data();
                    } else {
                        out += c;
                    }
            }
        }
    }

    // Shortest round-trip form; integral values keep a trailing ".0" so they still read as floats.
    std::string format_double(double d) {
        std::array<char, DOUBLE_BUFFER_SIZE> buf{};
        auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
        if (ec != std::errc{}) {
            return std::to_string(d);
        }

        std::string s(buf.data(), end);
        if (s.find_first_of(".eE") == std::string::npos) {
            s += ".0";
        }
        return s;
    }
}  // namespace json_utils
