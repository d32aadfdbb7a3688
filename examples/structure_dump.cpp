/**
 * @file structure_dump.cpp
 * @brief Print the PNG chunks, ZIP records and WAV chunks found in a file
 *
 * Each format is parsed on its own and leniently, so a polyglot shows
 * every structure it carries. Integrity problems are printed as warnings.
 */

#include <polyglot/png_stream.hh>
#include <polyglot/wav_file.hh>
#include <polyglot/zip_archive.hh>
#include <polyglot/exceptions.hh>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace {

    polyglot::byte_buffer read_file(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("Failed to open file: " + path);
        }
        std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        polyglot::byte_buffer out(raw.size());
        std::transform(raw.begin(), raw.end(), out.begin(), [](char c) { return static_cast<std::byte>(c); });
        return out;
    }

    std::string format_size(std::uint64_t size) {
        const char* units[] = {"B", "KB", "MB", "GB"};
        int unit = 0;
        double value = static_cast<double>(size);
        while (value >= 1024 && unit < 3) {
            value /= 1024;
            unit++;
        }
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(unit > 0 ? 2 : 0) << value << " " << units[unit];
        return oss.str();
    }

    polyglot::parse_options lenient_options(bool verbose) {
        polyglot::parse_options options;
        options.strict = false;
        if (verbose) {
            options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
                std::cerr << "  Warning [" << category << "] at offset " << offset << ": " << message << "\n";
            };
        }
        return options;
    }

    void dump_png(const polyglot::byte_buffer& data, const polyglot::parse_options& options) {
        if (!polyglot::png::has_signature(data)) {
            return;
        }
        std::cout << "PNG chunk stream\n";
        std::cout << "------------------------------------\n";
        try {
            auto s = polyglot::png::parse(data, options);
            for (const auto& c : s.chunks) {
                std::cout << "  " << std::setw(8) << c.file_offset << "  " << c.type
                          << "  " << std::setw(10) << c.length << " bytes"
                          << (c.type.is_ancillary() ? "  (ancillary)" : "") << "\n";
            }
            if (!s.trailing.empty()) {
                std::cout << "  " << format_size(s.trailing.size()) << " after IEND\n";
            }
        } catch (const polyglot::polyglot_error& e) {
            std::cout << "  " << polyglot::to_string(e.code()) << ": " << e.what() << "\n";
        }
        std::cout << "\n";
    }

    void dump_zip(const polyglot::byte_buffer& data, const polyglot::parse_options& options) {
        std::uint64_t eocd = 0;
        try {
            eocd = polyglot::zip::find_eocd(data, options);
        } catch (const polyglot::parse_error&) {
            return;  // not an archive
        }

        std::cout << "ZIP archive (EOCD at offset " << eocd << ")\n";
        std::cout << "------------------------------------\n";
        try {
            std::uint64_t origin = 0;
            polyglot::zip::archive archive;
            try {
                archive = polyglot::zip::parse(data, 0, options);
            } catch (const polyglot::parse_error& e) {
                auto inferred = polyglot::zip::infer_origin(data, options);
                if (!inferred || *inferred == 0) {
                    throw;
                }
                std::cout << "  Offsets are relative to offset " << *inferred << " (" << e.what() << ")\n";
                origin = *inferred;
                archive = polyglot::zip::parse(data, origin, options);
            }

            std::cout << "  Archive starts at offset " << origin + archive.start_offset;
            if (!archive.leading.empty()) {
                std::cout << " after " << archive.leading.size() << " leading bytes";
            }
            std::cout << "\n";
            for (const auto& entry : polyglot::zip::entries(archive)) {
                std::cout << "  " << std::setw(8) << entry.local_header_offset << "  "
                          << std::setw(10) << entry.compressed_size << " / "
                          << std::setw(10) << entry.uncompressed_size
                          << "  crc 0x" << std::hex << std::setw(8) << std::setfill('0') << entry.crc32
                          << std::dec << std::setfill(' ')
                          << (entry.compression == polyglot::zip::method_stored ? "  stored    " : "  compressed")
                          << "  " << entry.filename << "\n";
            }
        } catch (const polyglot::polyglot_error& e) {
            std::cout << "  " << polyglot::to_string(e.code()) << ": " << e.what() << "\n";
        }
        std::cout << "\n";
    }

    void dump_wav(const polyglot::byte_buffer& data, const polyglot::parse_options& options) {
        if (!polyglot::starts_with_at(data, 0, "RIFF")) {
            return;
        }
        std::cout << "RIFF WAVE\n";
        std::cout << "------------------------------------\n";
        try {
            auto f = polyglot::wav::parse(data, options);
            auto fmt = polyglot::wav::format_of(f);
            std::cout << "  " << fmt.channels << " channel(s), " << fmt.sample_rate << " Hz, "
                      << fmt.bits_per_sample << " bits, format tag " << fmt.format_tag << "\n";
            for (const auto& c : f.chunks) {
                std::cout << "  " << std::setw(8) << c.file_offset << "  " << c.id
                          << "  " << std::setw(10) << c.size << " bytes\n";
            }
            if (!f.trailing.empty()) {
                std::cout << "  " << format_size(f.trailing.size()) << " after the RIFF form\n";
            }
        } catch (const polyglot::polyglot_error& e) {
            std::cout << "  " << polyglot::to_string(e.code()) << ": " << e.what() << "\n";
        }
        std::cout << "\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cout << "Usage: " << argv[0] << " <file> [--verbose]\n";
        std::cout << "\nPrints every PNG, ZIP and WAV structure found in the file.\n";
        std::cout << "  --verbose  Also print integrity warnings\n";
        return 1;
    }

    bool verbose = argc == 3 && std::string(argv[2]) == "--verbose";
    try {
        auto data = read_file(argv[1]);
        std::cout << "File: " << argv[1] << " (" << format_size(data.size()) << ")\n\n";

        auto options = lenient_options(verbose);
        dump_png(data, options);
        dump_zip(data, options);
        dump_wav(data, options);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
