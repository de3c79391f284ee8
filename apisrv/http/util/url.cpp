#include "url.hpp"

#include <algorithm>
#include <cstdint>

namespace apisrv::http::util::url{

    namespace {
        inline int hex_digit(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        inline bool is_continuation(uint8_t b) {
            return b >= 0x80 && b <= 0xBF;
        }

        // allowed range of the second byte, excluding overlongs, surrogates and code points above U+10FFFF
        inline bool valid_second_byte(uint8_t b1, uint8_t b2) {
            switch (b1) {
                case 0xE0: return b2 >= 0xA0 && b2 <= 0xBF;
                case 0xED: return b2 >= 0x80 && b2 <= 0x9F;
                case 0xF0: return b2 >= 0x90 && b2 <= 0xBF;
                case 0xF4: return b2 >= 0x80 && b2 <= 0x8F;
                default: return is_continuation(b2);
            }
        }

        /**
         * Scans the sequence starting at bytes[i]. Returns the number of bytes it spans and sets
         * valid accordingly. An ill-formed sequence spans its maximal subpart (at least one byte).
         */
        size_t scan_utf8_sequence(const uint8_t* bytes, size_t len, size_t i, bool& valid) {
            const uint8_t b1 = bytes[i];
            size_t seq = 0;
            if (b1 <= 0x7F) seq = 1;
            else if (b1 >= 0xC2 && b1 <= 0xDF) seq = 2;
            else if (b1 >= 0xE0 && b1 <= 0xEF) seq = 3;
            else if (b1 >= 0xF0 && b1 <= 0xF4) seq = 4;

            valid = false;
            if (seq == 0) return 1;

            for (size_t k = 1; k < seq; ++k) {
                if (i + k >= len) return k;
                const uint8_t b = bytes[i + k];
                if (k == 1 ? !valid_second_byte(b1, b) : !is_continuation(b)) return k;
            }
            valid = true;
            return seq;
        }
    }

    // Well-formed UTF-8 byte sequences, Unicode Table 3-7
    bool is_valid_utf8(std::string_view data) {
        auto* bytes = reinterpret_cast<const uint8_t*>(data.data());
        size_t i = 0;
        while (i < data.size()) {
            bool valid;
            i += scan_utf8_sequence(bytes, data.size(), i, valid);
            if (!valid) return false;
        }
        return true;
    }

    std::string to_valid_utf8(std::string_view data) {
        auto* bytes = reinterpret_cast<const uint8_t*>(data.data());
        std::string out;
        out.reserve(data.size());
        size_t i = 0;
        while (i < data.size()) {
            bool valid;
            size_t span = scan_utf8_sequence(bytes, data.size(), i, valid);
            if (valid) {
                out.append(data.substr(i, span));
            } else {
                out += "\xEF\xBF\xBD";
            }
            i += span;
        }
        return out;
    }

    bool uri_component_decode(std::string_view in, std::string& out) {
        out.clear();
        out.reserve(in.size());

        for (size_t i = 0; i < in.size(); ++i) {
            if (in[i] == '%') {
                if (i + 2 >= in.size()) return false;
                int hi = hex_digit(in[i + 1]);
                int lo = hex_digit(in[i + 2]);
                if (hi < 0 || lo < 0) return false;
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
            } else {
                out += in[i];
            }
        }
        return is_valid_utf8(out);
    }

    std::string form_decode(std::string_view in) {
        std::string out;
        out.reserve(in.size());

        for (size_t i = 0; i < in.size(); ++i) {
            if (in[i] == '%' && i + 2 < in.size()) {
                int hi = hex_digit(in[i + 1]);
                int lo = hex_digit(in[i + 2]);
                if (hi >= 0 && lo >= 0) {
                    out += static_cast<char>((hi << 4) | lo);
                    i += 2;
                    continue;
                }
                out += in[i];
            } else if (in[i] == '+') {
                out += ' ';
            } else {
                out += in[i];
            }
        }
        return to_valid_utf8(out);
    }

    void parse_url_encoded_data(std::string_view data, std::multimap<std::string, std::string>& store) {
        size_t pos = 0;
        while (pos < data.size()) {
            // find the end of the current key=value pair
            size_t pair_end = data.find('&', pos);
            if (pair_end == std::string_view::npos) pair_end = data.size();

            std::string_view pair = data.substr(pos, pair_end - pos);

            // find the '=' separator within the pair
            size_t eq_pos = pair.find('=');
            std::string_view key = pair.substr(0, eq_pos);
            std::string_view value;
            if (eq_pos != std::string_view::npos) {
                value = pair.substr(eq_pos + 1);
            }

            if (!key.empty()) {
                store.emplace(form_decode(key), form_decode(value));
            }

            pos = pair_end + 1;
        }
    }

    nlohmann::json parse_url_encoded_object(std::string_view data) {
        std::multimap<std::string, std::string> store;
        parse_url_encoded_data(data, store);

        auto result = nlohmann::json::object();
        for (const auto& [key, value] : store) {
            auto existing = result.find(key);
            if (existing == result.end()) {
                result[key] = value;
            } else if (existing->is_array()) {
                existing->push_back(value);
            } else {
                *existing = nlohmann::json::array({*existing, value});
            }
        }
        return result;
    }

}
