//
// Created by igor on 04/09/2025.
//

#include <polyglot/container_format.hh>
#include <polyglot/png_stream.hh>
#include <cctype>
#include <string>

namespace polyglot {

    std::string_view to_string(container_format format) {
        switch (format) {
            case container_format::png:     return "png";
            case container_format::zip:     return "zip";
            case container_format::wav:     return "wav";
            case container_format::unknown: return "unknown";
            case container_format::any:     return "any";
        }
        // make compiler happy
        return "unknown";
    }

    std::optional<container_format> format_from_name(std::string_view name) {
        std::string lower(name);
        for (auto& c : lower) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (lower == "png") {
            return container_format::png;
        }
        if (lower == "zip") {
            return container_format::zip;
        }
        if (lower == "wav" || lower == "wave" || lower == "riff") {
            return container_format::wav;
        }
        if (lower == "any") {
            return container_format::any;
        }
        return std::nullopt;
    }

    container_format sniff_format(const byte_buffer& data) {
        if (png::has_signature(data)) {
            return container_format::png;
        }
        if (starts_with_at(data, 0, "RIFF") && starts_with_at(data, 8, "WAVE")) {
            return container_format::wav;
        }
        if (starts_with_at(data, 0, "PK\x03\x04") || starts_with_at(data, 0, "PK\x05\x06")) {
            return container_format::zip;
        }
        return container_format::unknown;
    }
}
