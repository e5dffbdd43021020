#include <iostream>
#include <string>
#include <vector>
#include <sodium.h>
#include <termios.h>
#include <unistd.h>

#include "../utils/logging.hpp"
#include "../core/Errors.hpp"
#include "../storage/Storage.hpp"
#include "CliSupport.hpp"

struct CliOptions {
    std::string path = ".";
    std::string log_file;
    bool verbose = false;
    bool fast_kdf = false;
    bool assume_yes = false;
};

void printUsage() {
    std::cerr <<
        "Usage: fastmem [--path DIR] [--log FILE] [--verbose] [--fast-kdf] [--yes] <command> ...\n"
        "\n"
        "Commands:\n"
        "  init <name>                      create or open a storage\n"
        "  set-password <name> <password>   set or change the password\n"
        "  set <name> <key> <value>         store a value (JSON if it parses, else a string)\n"
        "  get <name> <key>                 print a value\n"
        "  delete <name> <key>              remove a value\n"
        "  clear <name>                     remove every value (asks unless --yes)\n"
        "  keys <name>                      list stored keys\n"
        "  backup <name> <snapshot>         save a named snapshot\n"
        "  restore <name> <snapshot>        replace the storage with a snapshot (asks unless --yes)\n"
        "  snapshots <name>                 list snapshots\n";
}

// Read a password without echo when stdin is a terminal.
std::string readPassword(const char* prompt) {
    bool tty = isatty(STDIN_FILENO) != 0;
    termios saved{};

    if (tty) {
        std::cerr << prompt << std::flush;
        if (tcgetattr(STDIN_FILENO, &saved) == 0) {
            termios noecho = saved;
            noecho.c_lflag &= ~ECHO;
            tcsetattr(STDIN_FILENO, TCSANOW, &noecho);
        }
    }

    std::string pw;
    std::getline(std::cin, pw);

    if (tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &saved);
        std::cerr << "\n";
    }
    if (!pw.empty() && pw.back() == '\r') pw.pop_back();
    return pw;
}

// Prompt for the password if the storage came up locked.
void unlockIfNeeded(Storage& storage) {
    if (!storage.isLocked()) return;
    std::string pw = readPassword("Enter password: ");
    storage.unlock(pw);
    if (!pw.empty()) sodium_memzero(&pw[0], pw.size());
}

bool needArgs(const std::vector<std::string>& args, std::size_t n) {
    if (args.size() == n) return true;
    printUsage();
    return false;
}

int runCommand(const CliOptions& opts, const std::vector<std::string>& args) {
    const std::string& cmd = args[0];

    StorageOptions storage_opts;
    if (opts.fast_kdf) storage_opts.kdf = KdfParams::minimal();

    if (cmd == "init") {
        if (!needArgs(args, 2)) return EXIT_USAGE;
        Storage storage(args[1], opts.path, storage_opts);
        storage.init();
        std::cout << "Initialized storage at " << storage.directory().string() << "\n";
        return EXIT_OK;
    }

    if (cmd == "set-password") {
        if (!needArgs(args, 3)) return EXIT_USAGE;
        Storage storage(args[1], opts.path, storage_opts);
        storage.init();
        if (storage.hasPassword()) {
            std::string current = readPassword("Current password: ");
            storage.unlock(current);
            if (!current.empty()) sodium_memzero(&current[0], current.size());
        }
        storage.setPassword(args[2]);
        storage.save();
        std::cout << "Password set successfully\n";
        return EXIT_OK;
    }

    if (cmd == "set") {
        if (!needArgs(args, 4)) return EXIT_USAGE;
        Storage storage(args[1], opts.path, storage_opts);
        storage.init();
        unlockIfNeeded(storage);
        nlohmann::json value = parseValueArg(args[3]);
        storage.setJson(args[2], value);
        storage.save();
        std::cout << "Set " << args[2] << " = " << value.dump() << "\n";
        return EXIT_OK;
    }

    if (cmd == "get") {
        if (!needArgs(args, 3)) return EXIT_USAGE;
        Storage storage(args[1], opts.path, storage_opts);
        storage.init();
        unlockIfNeeded(storage);
        std::cout << formatValue(storage.get(args[2])) << "\n";
        return EXIT_OK;
    }

    if (cmd == "delete") {
        if (!needArgs(args, 3)) return EXIT_USAGE;
        Storage storage(args[1], opts.path, storage_opts);
        storage.init();
        unlockIfNeeded(storage);
        storage.remove(args[2]);
        storage.save();
        std::cout << "Deleted key: " << args[2] << "\n";
        return EXIT_OK;
    }

    if (cmd == "clear") {
        if (!needArgs(args, 2)) return EXIT_USAGE;
        Storage storage(args[1], opts.path, storage_opts);
        storage.init();
        unlockIfNeeded(storage);
        if (!opts.assume_yes && !confirm(std::cin, std::cerr, "Are you sure you want to clear all data?")) {
            std::cout << "Aborted\n";
            return EXIT_OK;
        }
        storage.clear();
        storage.save();
        std::cout << "Cleared all data\n";
        return EXIT_OK;
    }

    if (cmd == "keys") {
        if (!needArgs(args, 2)) return EXIT_USAGE;
        Storage storage(args[1], opts.path, storage_opts);
        storage.init();
        unlockIfNeeded(storage);
        for (const auto& k : storage.keys()) std::cout << k << "\n";
        return EXIT_OK;
    }

    if (cmd == "backup") {
        if (!needArgs(args, 3)) return EXIT_USAGE;
        Storage storage(args[1], opts.path, storage_opts);
        storage.init();
        storage.save(args[2]);
        std::cout << "Saved snapshot " << args[2] << "\n";
        return EXIT_OK;
    }

    if (cmd == "restore") {
        if (!needArgs(args, 3)) return EXIT_USAGE;
        // replacing the current state needs the current password
        Storage storage(args[1], opts.path, storage_opts);
        storage.init();
        unlockIfNeeded(storage);
        if (!opts.assume_yes &&
            !confirm(std::cin, std::cerr, "Replace '" + args[1] + "' with snapshot '" + args[2] + "'?")) {
            std::cout << "Aborted\n";
            return EXIT_OK;
        }
        storage.load(args[2]);
        storage.save();
        std::cout << "Restored snapshot " << args[2] << "\n";
        return EXIT_OK;
    }

    if (cmd == "snapshots") {
        if (!needArgs(args, 2)) return EXIT_USAGE;
        Storage storage(args[1], opts.path, storage_opts);
        for (const auto& s : storage.snapshots()) std::cout << s << "\n";
        return EXIT_OK;
    }

    std::cerr << "Unknown command '" << cmd << "'\n";
    printUsage();
    return EXIT_USAGE;
}

int main(int argc, char** argv) {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return EXIT_FAILURE_OTHER;
    }

    CliOptions opts;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (!args.empty()) {
            args.push_back(a);
        }
        else if ((a == "--path" || a == "--log") && i + 1 < argc) {
            (a == "--path" ? opts.path : opts.log_file) = argv[++i];
        }
        else if (a == "--verbose") {
            opts.verbose = true;
        }
        else if (a == "--fast-kdf") {
            opts.fast_kdf = true;
        }
        else if (a == "--yes" || a == "-y") {
            opts.assume_yes = true;
        }
        else if (a == "-h" || a == "--help") {
            printUsage();
            return EXIT_OK;
        }
        else if (!a.empty() && a[0] == '-') {
            std::cerr << "Unknown option '" << a << "'\n";
            printUsage();
            return EXIT_USAGE;
        }
        else {
            args.push_back(a);
        }
    }

    if (args.empty()) {
        printUsage();
        return EXIT_USAGE;
    }

    try {
        Log::init(opts.log_file.empty() ? opts.path + "/fastmem.log" : opts.log_file, opts.verbose);
        spdlog::info("Command '{}' started", args[0]);

        int rc = runCommand(opts, args);
        spdlog::info("Command '{}' finished with code {}", args[0], rc);
        return rc;
    }
    catch (const StorageError& e) {
        spdlog::error("Command '{}' failed: {} ({})", args[0], e.what(), errorKindName(e.kind()));
        std::cerr << "Error: " << e.what() << "\n";
        return exitCodeFor(e.kind());
    }
    catch (const std::invalid_argument& e) {
        spdlog::error("Command '{}' rejected: {}", args[0], e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
    catch (const std::exception& e) {
        spdlog::error("Command '{}' failed: {}", args[0], e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE_OTHER;
    }
}
