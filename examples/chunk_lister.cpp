/**
 * @file chunk_lister.cpp
 * @brief List the chunks of a PNG file
 *
 * This is a minimal example showing how to walk a PNG file chunk by
 * chunk and print each chunk's type, size and property bits.
 */

#include <pngmsg/parser.hh>
#include <pngmsg/exceptions.hh>
#include <iostream>
#include <fstream>
#include <iomanip>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file.png>\n";
        std::cout << "\n";
        std::cout << "Lists all chunks in a PNG file.\n";
        return 1;
    }

    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    pngmsg::parse_options options;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    std::cout << "Parsing: " << argv[1] << "\n";
    std::cout << "====================\n\n";

    try {
        pngmsg::for_each_chunk(file, [](const auto& chunk) {
            const auto& type = chunk.header.type;
            std::cout << std::setw(4) << chunk.index << "  " << type.to_string()
                      << "  " << std::setw(10) << chunk.header.length << " bytes"
                      << "  offset " << chunk.header.file_offset
                      << "  [" << (type.is_critical() ? "critical" : "ancillary")
                      << ", " << (type.is_public() ? "public" : "private")
                      << ", " << (type.is_safe_to_copy() ? "safe-to-copy" : "unsafe-to-copy")
                      << "]\n";
        }, options);

        std::cout << "\nParsing completed successfully!\n";

    } catch (const pngmsg::pngmsg_error& e) {
        std::cerr << "Error: " << pngmsg::to_string(e.kind()) << ": " << e.what() << "\n";
        return 1;
    }

    return 0;
}
