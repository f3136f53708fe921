/**
 * @file pngmsg.cpp
 * @brief Hide, reveal and remove text messages in PNG files
 *
 * Messages are stored in their own chunk, inserted in front of IEND.
 * Use a private ancillary safe-to-copy type such as "ruSt" so that
 * image viewers ignore the chunk and editors keep it.
 *
 *   pngmsg encode <file> <type> <message> [output]
 *   pngmsg decode <file> <type>
 *   pngmsg remove <file> <type>
 *   pngmsg print  <file>
 */

#include <pngmsg/png.hh>
#include <pngmsg/exceptions.hh>
#include <iostream>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace {

    void print_usage(const char* prog) {
        std::cout << "Usage: " << prog << " <command> [arguments]\n";
        std::cout << "\n";
        std::cout << "Commands:\n";
        std::cout << "  encode <file> <type> <message> [output]\n";
        std::cout << "    Store <message> in a new chunk of <type>; writes to [output] or back to <file>\n";
        std::cout << "  decode <file> <type>\n";
        std::cout << "    Print the message stored in the first chunk of <type>\n";
        std::cout << "  remove <file> <type>\n";
        std::cout << "    Delete the first chunk of <type> and rewrite <file>\n";
        std::cout << "  print <file>\n";
        std::cout << "    List every chunk\n";
        std::cout << "\n";
        std::cout << "Example:\n";
        std::cout << "  " << prog << " encode photo.png ruSt \"meet at dawn\"\n";
    }

    pngmsg::parse_options make_options() {
        pngmsg::parse_options options;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
        };
        return options;
    }

    pngmsg::png load(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file, "Cannot open file '", path, "'");
        return pngmsg::png::parse(file, make_options());
    }

    void save(const pngmsg::png& image, const std::string& path) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_UNLESS(file, "Cannot create file '", path, "'");
        image.write(file);
        file.flush();
        THROW_IO_UNLESS(file, "Failed to write file '", path, "'");
    }

    int encode(const std::string& path, const std::string& type, const std::string& message,
               const std::string& output) {
        auto image = load(path);
        auto chunk_type = pngmsg::chunk_type::from_string(type);
        if (!chunk_type.is_valid()) {
            std::cerr << "Warning: chunk type '" << type << "' has the reserved bit set\n";
        }
        if (chunk_type.is_critical()) {
            std::cerr << "Warning: chunk type '" << type << "' is critical; viewers may reject the file\n";
        }

        std::vector<std::byte> data;
        data.reserve(message.size());
        for (char c : message) {
            data.push_back(static_cast<std::byte>(c));
        }
        image.append_chunk(pngmsg::chunk(chunk_type, std::move(data)));
        save(image, output);

        std::cout << "Stored " << message.size() << " bytes in chunk '" << type << "' of " << output << "\n";
        return 0;
    }

    int decode(const std::string& path, const std::string& type) {
        auto image = load(path);
        const pngmsg::chunk* c = image.chunk_by_type(type);
        if (!c) {
            std::cerr << "No chunk of type '" << type << "' in " << path << "\n";
            return 1;
        }
        std::cout << c->data_as_string() << "\n";
        return 0;
    }

    int remove_message(const std::string& path, const std::string& type) {
        auto image = load(path);
        auto removed = image.remove_chunk_by_type(type);
        save(image, path);

        std::cout << "Removed chunk " << removed.type() << " (" << removed.length() << " bytes) from " << path << "\n";
        return 0;
    }

    int print(const std::string& path) {
        auto image = load(path);
        std::cout << path << ": " << image;
        return 0;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "encode" && (args.size() == 3 || args.size() == 4)) {
            return encode(args[0], args[1], args[2], args.size() == 4 ? args[3] : args[0]);
        } else if (command == "decode" && args.size() == 2) {
            return decode(args[0], args[1]);
        } else if (command == "remove" && args.size() == 2) {
            return remove_message(args[0], args[1]);
        } else if (command == "print" && args.size() == 1) {
            return print(args[0]);
        }
    } catch (const pngmsg::pngmsg_error& e) {
        std::cerr << "error: " << pngmsg::to_string(e.kind()) << ": " << e.what() << "\n";
        return 1;
    }

    print_usage(argv[0]);
    return 1;
}
