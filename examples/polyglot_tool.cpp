/**
 * @file polyglot_tool.cpp
 * @brief Create, validate and extract PNG/ZIP/WAV polyglots
 *
 * Usage:
 *   polyglot_tool create <method> <host> <guest> <output> [--lenient]
 *   polyglot_tool wrap <png> <output>
 *   polyglot_tool validate <file>
 *   polyglot_tool extract <file> <png|zip|wav|any> <output>
 */

#include <polyglot/polyglot.hh>
#include <polyglot/zip_archive.hh>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

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

    void write_file(const std::string& path, const polyglot::byte_buffer& data) {
        std::ofstream out(path, std::ios::binary);
        if (!out) {
            throw std::runtime_error("Failed to create file: " + path);
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out) {
            throw std::runtime_error("Failed to write file: " + path);
        }
    }

    void print_warning(std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    }

    void print_usage(const char* argv0) {
        std::cout << "Usage: " << argv0 << " <command> [arguments]\n\n";
        std::cout << "Commands:\n";
        std::cout << "  create <method> <host> <guest> <output> [--lenient]\n";
        std::cout << "      method: text (PNG host), zip (ZIP host, guest prepended),\n";
        std::cout << "              riff (WAV host), bidirectional (experimental)\n";
        std::cout << "  wrap <png> <output>          Store a PNG as image.png in a new ZIP\n";
        std::cout << "  validate <file>              Report every format the file is valid as\n";
        std::cout << "  extract <file> <format> <output>\n";
        std::cout << "      format: png, zip, wav or any\n\n";
        std::cout << "Examples:\n";
        std::cout << "  " << argv0 << " create text image.png archive.zip out.png\n";
        std::cout << "  " << argv0 << " create zip archive.zip image.png out.png.zip\n";
        std::cout << "  " << argv0 << " extract out.png zip recovered.zip\n";
    }

    int create(const std::string& method, const std::string& host_path, const std::string& guest_path,
               const std::string& output, bool lenient) {
        polyglot::compose_options options;
        // Tolerates damaged inputs; the artifact itself must still be clean
        options.strict = !lenient;
        options.on_warning = print_warning;

        auto artifact = polyglot::compose(method, read_file(host_path), read_file(guest_path), options);
        write_file(output, artifact.bytes);

        std::cout << "Created " << output << " (" << artifact.bytes.size() << " bytes)\n";
        std::cout << "  Method: " << polyglot::to_string(artifact.method) << "\n";
        std::cout << "  Host format: " << polyglot::to_string(artifact.host) << "\n";
        return 0;
    }

    int wrap(const std::string& png_path, const std::string& output) {
        auto archive = polyglot::zip::build_stored({{"image.png", read_file(png_path)}});
        write_file(output, polyglot::zip::serialize(archive));
        std::cout << "Created " << output << " with 1 stored entry\n";
        return 0;
    }

    int validate(const std::string& path) {
        auto result = polyglot::validate(read_file(path));

        std::cout << "File: " << path << "\n";
        std::cout << "=====================================\n";
        std::cout << "  Host format: " << polyglot::to_string(result.host) << "\n";
        std::cout << "  PNG: " << (result.png_valid ? "valid" : "invalid") << "\n";
        std::cout << "  ZIP: " << (result.zip_valid ? "valid" : "invalid") << "\n";
        std::cout << "  WAV: " << (result.wav_valid ? "valid" : "invalid") << "\n";
        if (result.detected) {
            std::cout << "  Embedding: " << polyglot::to_string(*result.detected) << "\n";
        }
        for (const auto& payload : result.payloads) {
            std::cout << "  Payload: " << polyglot::to_string(payload.format) << ", "
                      << payload.bytes.size() << " bytes (" << polyglot::to_string(payload.source) << ")\n";
        }
        if (!result.findings.empty()) {
            std::cout << "\nFindings:\n";
            for (const auto& f : result.findings) {
                std::cout << "  [" << polyglot::to_string(f.format) << "] "
                          << polyglot::to_string(f.code) << " at offset " << f.offset
                          << ": " << f.message << "\n";
            }
        }
        return result.valid_count() >= 2 ? 0 : 2;
    }

    int extract(const std::string& path, const std::string& format_name, const std::string& output) {
        auto target = polyglot::format_from_name(format_name);
        if (!target) {
            std::cerr << "Unknown format: " << format_name << "\n";
            return 1;
        }
        auto payload = polyglot::extract(read_file(path), *target);
        write_file(output, payload);
        std::cout << "Extracted " << payload.size() << " bytes to " << output << "\n";
        return 0;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    try {
        if (command == "create" && (argc == 6 || argc == 7)) {
            bool lenient = argc == 7 && std::string(argv[6]) == "--lenient";
            return create(argv[2], argv[3], argv[4], argv[5], lenient);
        }
        if (command == "wrap" && argc == 4) {
            return wrap(argv[2], argv[3]);
        }
        if (command == "validate" && argc == 3) {
            return validate(argv[2]);
        }
        if (command == "extract" && argc == 5) {
            return extract(argv[2], argv[3], argv[4]);
        }
    } catch (const polyglot::polyglot_error& e) {
        std::cerr << "Error (" << polyglot::to_string(e.code()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    print_usage(argv[0]);
    return 1;
}
