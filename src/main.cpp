#include "commands.hpp"
#include <argparse/argparse.hpp>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("pngme", "0.1.0", argparse::default_arguments::all);
    program.add_description("Hide messages inside PNG chunks.");

    program.add_argument("--verbose")
        .help("Print what is being done")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser encode_command("encode", "0.1.0", argparse::default_arguments::help);
    encode_command.add_description("Append a chunk carrying a message");
    encode_command.add_argument("src").help("The PNG file to read");
    encode_command.add_argument("dst").help("Where to write the result");
    encode_command.add_argument("type").help("4-letter chunk type, e.g. ruSt");
    encode_command.add_argument("message").help("The message to hide");

    argparse::ArgumentParser decode_command("decode", "0.1.0", argparse::default_arguments::help);
    decode_command.add_description("Print the message of the first chunk of a type");
    decode_command.add_argument("src").help("The PNG file to read");
    decode_command.add_argument("type").help("4-letter chunk type");

    argparse::ArgumentParser remove_command("remove", "0.1.0", argparse::default_arguments::help);
    remove_command.add_description("Remove the first chunk of a type (rewrites the file)");
    remove_command.add_argument("src").help("The PNG file to modify");
    remove_command.add_argument("type").help("4-letter chunk type");

    argparse::ArgumentParser print_command("print", "0.1.0", argparse::default_arguments::help);
    print_command.add_description("List every chunk of a file");
    print_command.add_argument("src").help("The PNG file to read");

    program.add_subparser(encode_command);
    program.add_subparser(decode_command);
    program.add_subparser(remove_command);
    program.add_subparser(print_command);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    const bool verbose = program.get<bool>("--verbose");

    try {
        if (program.is_subcommand_used(encode_command)) {
            const auto src = encode_command.get<std::string>("src");
            const auto dst = encode_command.get<std::string>("dst");
            if (verbose) std::cout << "Encoding " << src << " -> " << dst << "...\n";
            pngme::encode(src, dst, encode_command.get<std::string>("type"),
                          encode_command.get<std::string>("message"));
            if (verbose) std::cout << "Message written to " << dst << "\n";
        }
        else if (program.is_subcommand_used(decode_command)) {
            const auto src = decode_command.get<std::string>("src");
            if (verbose) std::cout << "Decoding " << src << "...\n";
            std::cout << "Decoded Message: "
                      << pngme::decode(src, decode_command.get<std::string>("type")) << "\n";
        }
        else if (program.is_subcommand_used(remove_command)) {
            const auto src = remove_command.get<std::string>("src");
            const auto removed = pngme::remove(src, remove_command.get<std::string>("type"));
            if (verbose) std::cout << "Removed " << removed << " from " << src << "\n";
        }
        else if (program.is_subcommand_used(print_command)) {
            std::cout << pngme::print(print_command.get<std::string>("src"));
        }
        else {
            std::cerr << "No command given\n";
            std::cerr << program;
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
