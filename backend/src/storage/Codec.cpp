#include "Codec.hpp"
#include "../core/Errors.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <set>
#include <string>
#include <system_error>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "FASTMEM\n";
static constexpr std::size_t MAGIC_LEN = sizeof(MAGIC_HDR) - 1;
static constexpr std::uintmax_t MAX_STATE_BYTES = 256ull * 1024 * 1024; // hard cap

// ---------- little endian writers ----------
static void putU8(std::vector<unsigned char>& out, std::uint8_t v) {
    out.push_back(v);
}

static void putU32(std::vector<unsigned char>& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<unsigned char>(v >> (8 * i)));
}

static void putU64(std::vector<unsigned char>& out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<unsigned char>(v >> (8 * i)));
}

static void putBytes(std::vector<unsigned char>& out, const unsigned char* p, std::size_t n) {
    if (n > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("field too large to persist");
    }
    putU32(out, static_cast<std::uint32_t>(n));
    out.insert(out.end(), p, p + n);
}

static void putBytes(std::vector<unsigned char>& out, const std::vector<unsigned char>& v) {
    putBytes(out, v.data(), v.size());
}

static void putString(std::vector<unsigned char>& out, const std::string& s) {
    putBytes(out, reinterpret_cast<const unsigned char*>(s.data()), s.size());
}

// ---------- bounds-checked reader ----------
namespace {

struct Reader {
    const std::vector<unsigned char>& buf;
    std::size_t pos = 0;

    std::size_t remaining() const { return buf.size() - pos; }

    void need(std::size_t n, const char* what) const {
        if (n > remaining()) {
            spdlog::error("Persisted state truncated while reading {}", what);
            throw CorruptData(std::string("truncated data while reading ") + what);
        }
    }

    std::uint8_t u8(const char* what) {
        need(1, what);
        return buf[pos++];
    }

    std::uint32_t u32(const char* what) {
        need(4, what);
        std::uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v |= static_cast<std::uint32_t>(buf[pos + i]) << (8 * i);
        pos += 4;
        return v;
    }

    std::uint64_t u64(const char* what) {
        need(8, what);
        std::uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v |= static_cast<std::uint64_t>(buf[pos + i]) << (8 * i);
        pos += 8;
        return v;
    }

    std::vector<unsigned char> bytes(const char* what) {
        std::uint32_t n = u32(what);
        need(n, what);
        std::vector<unsigned char> v(buf.begin() + pos, buf.begin() + pos + n);
        pos += n;
        return v;
    }

    std::string str(const char* what) {
        std::uint32_t n = u32(what);
        need(n, what);
        std::string s(buf.begin() + pos, buf.begin() + pos + n);
        pos += n;
        return s;
    }
};

} // namespace

static Sealed readSealed(Reader& r, const char* what) {
    Sealed s;
    s.nonce = r.bytes(what);
    s.ciphertext = r.bytes(what);
    if (s.nonce.size() != NONCE_BYTES) {
        spdlog::error("Invalid nonce length {} in {}", s.nonce.size(), what);
        throw CorruptData(std::string("invalid nonce length in ") + what);
    }
    if (s.ciphertext.size() < TAG_BYTES) {
        spdlog::error("Ciphertext too short in {}", what);
        throw CorruptData(std::string("ciphertext too short in ") + what);
    }
    return s;
}

std::vector<unsigned char> Codec::serialize(const PersistedState& state) {
    std::vector<unsigned char> out;
    out.insert(out.end(), MAGIC_HDR, MAGIC_HDR + MAGIC_LEN);
    putU32(out, state.version);

    putBytes(out, state.salt);

    putU32(out, static_cast<std::uint32_t>(state.kdf.algorithm));
    putU64(out, state.kdf.ops_limit);
    putU64(out, state.kdf.mem_limit);

    if (state.canary) {
        putU8(out, 1);
        putBytes(out, state.canary->nonce);
        putBytes(out, state.canary->ciphertext);
    }
    else {
        putU8(out, 0);
    }

    putU32(out, static_cast<std::uint32_t>(state.entries.size()));
    for (const auto& e : state.entries) {
        putString(out, e.key);
        putBytes(out, e.nonce);
        putBytes(out, e.ciphertext);
    }

    spdlog::debug("Serialized {} entries into {} bytes", state.entries.size(), out.size());
    return out;
}

PersistedState Codec::deserialize(const std::vector<unsigned char>& bytes) {
    if (bytes.size() < MAGIC_LEN || std::memcmp(bytes.data(), MAGIC_HDR, MAGIC_LEN) != 0) {
        spdlog::error("Invalid magic header");
        throw CorruptData("unrecognized format tag");
    }

    Reader r{ bytes, MAGIC_LEN };
    PersistedState state;

    state.version = r.u32("version");
    if (state.version != FORMAT_VERSION) {
        spdlog::error("Unsupported format version {}", state.version);
        throw CorruptData("unsupported format version " + std::to_string(state.version));
    }

    state.salt = r.bytes("salt");
    if (state.salt.size() != SALT_BYTES) {
        spdlog::error("Salt length mismatch while decoding");
        throw CorruptData("invalid salt length");
    }

    state.kdf.algorithm = static_cast<int>(r.u32("kdf algorithm"));
    state.kdf.ops_limit = r.u64("kdf iterations");
    std::uint64_t mem = r.u64("kdf memory limit");
    if (mem > std::numeric_limits<std::size_t>::max()) {
        throw CorruptData("kdf memory limit out of range");
    }
    state.kdf.mem_limit = static_cast<std::size_t>(mem);
    if (!state.kdf.valid()) {
        spdlog::error("KDF parameters out of range");
        throw CorruptData("key derivation parameters out of range");
    }

    std::uint8_t has_canary = r.u8("canary flag");
    if (has_canary > 1) {
        throw CorruptData("invalid canary flag");
    }
    if (has_canary) {
        state.canary = readSealed(r, "canary");
    }

    std::uint32_t count = r.u32("entry count");
    std::set<std::string> seen;
    for (std::uint32_t i = 0; i < count; ++i) {
        Entry e;
        e.key = r.str("entry key");
        if (e.key.empty()) {
            throw CorruptData("empty entry key");
        }
        if (!seen.insert(e.key).second) {
            spdlog::error("Duplicate entry key in persisted state");
            throw CorruptData("duplicate entry key");
        }
        Sealed s = readSealed(r, "entry");
        e.nonce = std::move(s.nonce);
        e.ciphertext = std::move(s.ciphertext);
        state.entries.push_back(std::move(e));
    }

    if (r.remaining() != 0) {
        spdlog::error("{} trailing bytes after last entry", r.remaining());
        throw CorruptData("trailing data after last entry");
    }

    spdlog::debug("Deserialized {} entries", state.entries.size());
    return state;
}

static void syncDirectory(const std::filesystem::path& dir) {
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0) {
        spdlog::warn("Could not open '{}' to sync it: {}", dir.string(), std::strerror(errno));
        return;
    }
    if (::fsync(dfd) != 0) {
        spdlog::warn("fsync of directory '{}' failed: {}", dir.string(), std::strerror(errno));
    }
    ::close(dfd);
}

void Codec::writeFile(const std::filesystem::path& path, const std::vector<unsigned char>& bytes) {
    spdlog::info("Writing {} bytes to '{}'", bytes.size(), path.string());

    // unique sibling, so concurrent writers of one target never share a temp file
    std::string tmpl = path.string() + ".tmpXXXXXX";
    std::vector<char> tmp(tmpl.begin(), tmpl.end());
    tmp.push_back('\0');

    int fd = ::mkostemp(tmp.data(), O_CLOEXEC);
    if (fd < 0) {
        std::string why = std::strerror(errno);
        spdlog::error("Failed to create temporary file for '{}': {}", path.string(), why);
        throw IOError("cannot create temporary file for '" + path.string() + "': " + why);
    }

    auto fail = [&](const std::string& what) {
        std::string why = std::strerror(errno);
        spdlog::error("{} '{}' failed: {}", what, tmp.data(), why);
        ::close(fd);
        ::unlink(tmp.data());
        throw IOError(what + " '" + std::string(tmp.data()) + "' failed: " + why);
    };

    // 0600 before any byte lands in the file
    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) fail("chmod of");

    const unsigned char* p = bytes.data();
    std::size_t left = bytes.size();
    while (left > 0) {
        ssize_t w = ::write(fd, p, left);
        if (w < 0) {
            if (errno == EINTR) continue;
            fail("write to");
        }
        p += w;
        left -= static_cast<std::size_t>(w);
    }

    // data must be on disk before the rename makes it visible
    if (::fsync(fd) != 0) fail("fsync of");

    if (::close(fd) != 0) {
        std::string why = std::strerror(errno);
        spdlog::error("close of '{}' failed: {}", tmp.data(), why);
        ::unlink(tmp.data());
        throw IOError("close of '" + std::string(tmp.data()) + "' failed: " + why);
    }

    if (::rename(tmp.data(), path.c_str()) != 0) {
        std::string why = std::strerror(errno);
        spdlog::error("Rename '{}' -> '{}' failed: {}", tmp.data(), path.string(), why);
        ::unlink(tmp.data());
        throw IOError("cannot replace '" + path.string() + "': " + why);
    }

    std::filesystem::path dir = path.parent_path();
    syncDirectory(dir.empty() ? std::filesystem::path(".") : dir);
}

std::vector<unsigned char> Codec::readFile(const std::filesystem::path& path) {
    spdlog::info("Reading persisted state from '{}'", path.string());

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        spdlog::error("Cannot stat '{}': {}", path.string(), ec.message());
        throw IOError("cannot read '" + path.string() + "': " + ec.message());
    }
    if (size > MAX_STATE_BYTES) {
        spdlog::error("State file '{}' too large or corrupt", path.string());
        throw CorruptData("state file too large");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::error("Failed to open '{}' for reading", path.string());
        throw IOError("cannot open '" + path.string() + "' for reading");
    }

    std::vector<unsigned char> bytes(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (in.bad()) {
        spdlog::error("Read from '{}' failed", path.string());
        throw IOError("read from '" + path.string() + "' failed");
    }
    return bytes;
}
