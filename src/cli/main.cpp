// =============================================================================
// lexis CLI - vocabulary and vector file tool
// =============================================================================
//
// Usage:
//   lexis [global options] <command> [options]
//
// Commands:
//   convert-vectors   Convert (compressed) text vectors to the binary format
//   info              Load binary vectors and report the vocabulary size
//   export            Build a vocabulary from text vectors and save it
//   inspect           Print the default attributes of words
//   version           Show version information
//   help              Show this help message
//
// Examples:
//   lexis convert-vectors vectors.txt.bz2 vectors.bin
//   lexis info --vectors vectors.bin
//   lexis export --vectors vectors.txt --out vocab/
//   lexis inspect Hello 3.14 user@example.com
//
// =============================================================================

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "lexis/config.hpp"
#include "lexis/error.hpp"
#include "lexis/io/vector_io.hpp"
#include "lexis/io/vocab_disk.hpp"
#include "lexis/lex_attrs.hpp"
#include "lexis/lexeme.hpp"
#include "lexis/logging.hpp"
#include "lexis/symbols.hpp"
#include "lexis/vocab.hpp"

namespace lexis::cli {
    int cmd_convert_vectors(int argc, char* argv[]);
    int cmd_info(int argc, char* argv[]);
    int cmd_export(int argc, char* argv[]);
    int cmd_inspect(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define LEXIS_VERSION_MAJOR 1
#define LEXIS_VERSION_MINOR 0
#define LEXIS_VERSION_PATCH 0
#define LEXIS_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"convert-vectors", "Convert text vectors (.txt, .gz, .bz2) to binary", lexis::cli::cmd_convert_vectors},
    {"info",            "Load binary vectors and report counts", lexis::cli::cmd_info},
    {"export",          "Build a vocabulary from text vectors and save it", lexis::cli::cmd_export},
    {"inspect",         "Print the default attributes of words", lexis::cli::cmd_inspect},
    {"version",         "Show version information", lexis::cli::cmd_version},
    {"help",            "Show this help message", lexis::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

namespace lexis::cli {

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "lexis - lexicon and word vector store\n";
    std::cout << "Version " << LEXIS_VERSION_STRING << "\n\n";
    std::cout << "Usage: lexis [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 18; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     key=value configuration file\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Errors only\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  LEXIS_LOG_LEVEL         debug, info, warn, error\n";
    std::cout << "  LEXIS_LOG_FILE          Append log output to this file\n";
    std::cout << "  LEXIS_DATA_DIR          Base directory for relative paths\n";
    std::cout << "\nExamples:\n";
    std::cout << "  lexis convert-vectors vectors.txt.bz2 vectors.bin\n";
    std::cout << "  lexis info --vectors vectors.bin\n";
    std::cout << "  lexis export --vectors vectors.txt --out vocab/\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "lexis " << LEXIS_VERSION_STRING << "\n";
    std::cout << "Symbols: " << symbol_names().size() << "\n";
    std::cout << "Flag bits: " << constants::MIN_FLAG_ID << "-" << constants::MAX_FLAG_ID << "\n";
    return 0;
}

// =============================================================================
// Data Commands
// =============================================================================

// Relative paths resolve against data.dir when it is set
static std::filesystem::path resolve_path(const std::string& arg) {
    std::filesystem::path path(arg);
    std::string data_dir = Config::getInstance().get<std::string>("data.dir");
    if (path.is_relative() && !data_dir.empty()) {
        return std::filesystem::path(data_dir) / path;
    }
    return path;
}

int cmd_convert_vectors(int argc, char* argv[]) {
    std::vector<std::string> positional;
    for (int i = 0; i < argc; ++i) {
        if (argv[i][0] != '-') positional.emplace_back(argv[i]);
    }

    if (positional.size() != 2) {
        std::cerr << "Usage: lexis convert-vectors <input> <output>\n";
        std::cerr << "  <input>   Text vectors, optionally .gz or .bz2 compressed\n";
        std::cerr << "  <output>  Binary vector file to write\n";
        return 1;
    }

    size_t count = io::write_binary_vectors(resolve_path(positional[0]),
                                            resolve_path(positional[1]));
    if (!g_options.quiet) {
        std::cout << "Wrote " << count << " vectors\n";
    }
    return 0;
}

int cmd_info(int argc, char* argv[]) {
    std::string vectors;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--vectors" && i + 1 < argc) {
            vectors = argv[++i];
        }
    }

    if (vectors.empty()) {
        std::cerr << "Usage: lexis info --vectors <file.bin>\n";
        return 1;
    }

    Vocab vocab(lex_attrs::default_getters());
    int dim = vocab.load_vectors_from_bin_loc(resolve_path(vectors));

    size_t with_vector = 0;
    for (const LexemeC& lex : vocab) {
        if (!vocab.is_zero_vector(lex.vector)) ++with_vector;
    }

    std::cout << "Lexemes: " << vocab.size() - 1 << "\n";
    std::cout << "Strings: " << vocab.strings().size() << "\n";
    std::cout << "Dimension: " << dim << "\n";
    std::cout << "With vector: " << with_vector << "\n";
    return 0;
}

int cmd_export(int argc, char* argv[]) {
    std::string vectors;
    std::string out_dir;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--vectors" && i + 1 < argc) {
            vectors = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            out_dir = argv[++i];
        }
    }

    if (vectors.empty() || out_dir.empty()) {
        std::cerr << "Usage: lexis export --vectors <file.txt> --out <dir>\n";
        return 1;
    }

    std::ifstream in(resolve_path(vectors));
    if (!in.is_open()) {
        throw IOError("Could not open " + vectors, "cmd_export", "Check that the file exists");
    }

    Vocab vocab(lex_attrs::default_getters());
    int dim = vocab.load_vectors(in);

    const auto dir = resolve_path(out_dir);
    io::save_vocab(vocab, dir);
    if (dim > 0) {
        vocab.dump_vectors(dir / "vectors.bin");
    }

    if (!g_options.quiet) {
        std::cout << "Exported " << vocab.size() - 1 << " lexemes (dimension " << dim
                  << ") to " << dir.string() << "\n";
    }
    return 0;
}

int cmd_inspect(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: lexis inspect <word> [<word> ...]\n";
        return 1;
    }

    Vocab vocab(lex_attrs::default_getters());
    for (int i = 0; i < argc; ++i) {
        Lexeme lex = vocab[std::string_view(argv[i])];
        std::cout << lex.text() << "\n";
        std::cout << "  orth=" << lex.orth() << " id=" << lex.id() << " length=" << lex.length() << "\n";
        std::cout << "  lower=" << lex.lower_text() << " shape=" << lex.shape_text()
                  << " prefix=" << lex.prefix_text() << " suffix=" << lex.suffix_text() << "\n";
        std::cout << "  flags:";
        for (attr_id_t flag = constants::MIN_FLAG_ID; flag <= constants::MAX_FLAG_ID; ++flag) {
            if (check_flag(lex.c(), flag)) std::cout << ' ' << attr_name(flag);
        }
        std::cout << "\n";
    }
    return 0;
}

}  // namespace lexis::cli

// =============================================================================
// Main Entry Point
// =============================================================================

void parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-global argument is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (!lexis::init_config(g_options.config_file)) {
        return 1;
    }
    if (g_options.verbose) {
        lexis::set_log_level(lexis::LogLevel::DEBUG);
        lexis::Config::getInstance().print();
    } else if (g_options.quiet) {
        lexis::set_log_level(lexis::LogLevel::ERROR);
    }

    if (argc < 1) {
        lexis::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const lexis::LexisException& e) {
                LOG_ERROR(cmd_name, " failed");
                std::cerr << e.what() << "\n";
                return 2;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'lexis help' for usage.\n";
    return 1;
}
