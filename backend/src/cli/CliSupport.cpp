#include "CliSupport.hpp"
#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

int exitCodeFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidPassword: return EXIT_INVALID_PASSWORD;
    case ErrorKind::CorruptData:     return EXIT_CORRUPT_DATA;
    case ErrorKind::Locked:          return EXIT_LOCKED;
    case ErrorKind::KeyNotFound:     return EXIT_KEY_NOT_FOUND;
    case ErrorKind::NoKey:           return EXIT_NO_KEY;
    case ErrorKind::IO:              return EXIT_IO;
    case ErrorKind::Crypto:          return EXIT_FAILURE_OTHER;
    }
    return EXIT_FAILURE_OTHER;
}

nlohmann::json parseValueArg(const std::string& arg) {
    nlohmann::json parsed = nlohmann::json::parse(arg, nullptr, false);
    if (parsed.is_discarded()) return nlohmann::json(arg);
    return parsed;
}

std::string formatValue(const std::string& stored) {
    nlohmann::json parsed = nlohmann::json::parse(stored, nullptr, false);
    if (parsed.is_discarded()) return stored;
    return parsed.dump(2);
}

bool confirm(std::istream& in, std::ostream& out, const std::string& question) {
    out << question << " [y/N]: " << std::flush;

    std::string answer;
    if (!std::getline(in, answer)) return false;

    answer.erase(std::remove_if(answer.begin(), answer.end(),
        [](unsigned char c) { return std::isspace(c); }), answer.end());
    std::transform(answer.begin(), answer.end(), answer.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "y" || answer == "yes";
}
