/*
 * Streaming digests over OpenSSL EVP (SHA-256, SHA-512, MD5) and the file-level
 * checksum check the transfer engine runs before a partial file is finalized.
 */

#include <chartdl/downloader/integrity_verifier.h>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace chartdl::downloader {

namespace fs = std::filesystem;

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha512:
            return EVP_sha512();
        case HashAlgo::Md5:
            return EVP_md5();
        case HashAlgo::Sha256:
        default:
            return EVP_sha256();
    }
}

std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_hex(std::string_view s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string_view algo_name(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha512:
            return "sha512";
        case HashAlgo::Md5:
            return "md5";
        case HashAlgo::Sha256:
        default:
            return "sha256";
    }
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    explicit OpenSslIntegrityVerifier(HashAlgo algo) { reset(algo); }

    void reset(HashAlgo algo) override {
        _algo = algo;
        _md = resolve_algo(_algo);
        _ctx = EvpMdCtx{};
        _finalized = false;
        if (!_ctx || !_md)
            return;
        if (EVP_DigestInit_ex(_ctx.ctx, _md, nullptr) != 1) {
            _ctx = EvpMdCtx{};
        }
    }

    void update(std::span<const std::byte> data) override {
        if (!_ctx || _finalized || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1) {
            spdlog::warn("EVP_DigestUpdate failed; digest for this stream is invalid");
            _ctx = EvpMdCtx{};
        }
    }

    Checksum finalize() override {
        Checksum out;
        out.algo = _algo;
        if (!_ctx || _finalized)
            return out;

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) != 1) {
            _finalized = true;
            return out;
        }
        out.hex = to_hex_lower(md_buf.data(), md_len);
        // re-arm for reuse with the same algorithm
        reset(_algo);
        return out;
    }

private:
    HashAlgo _algo{HashAlgo::Sha256};
    const EVP_MD* _md{nullptr};
    EvpMdCtx _ctx{};
    bool _finalized{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo) {
    return std::make_unique<OpenSslIntegrityVerifier>(algo);
}

std::optional<Checksum> parseChecksum(std::string_view text) {
    auto trim = [](std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
            s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
            s.remove_suffix(1);
        return s;
    };
    text = trim(text);
    if (text.empty())
        return std::nullopt;

    Checksum out;
    if (auto colon = text.find(':'); colon != std::string_view::npos) {
        auto prefix = to_lower(text.substr(0, colon));
        auto hex = text.substr(colon + 1);
        if (prefix == "sha256")
            out.algo = HashAlgo::Sha256;
        else if (prefix == "sha512")
            out.algo = HashAlgo::Sha512;
        else if (prefix == "md5")
            out.algo = HashAlgo::Md5;
        else
            return std::nullopt;
        const std::size_t want = out.algo == HashAlgo::Sha256   ? 64
                                 : out.algo == HashAlgo::Sha512 ? 128
                                                                : 32;
        if (hex.size() != want || !is_hex(hex))
            return std::nullopt;
        out.hex = to_lower(hex);
        return out;
    }

    if (!is_hex(text))
        return std::nullopt;
    switch (text.size()) {
        case 64:
            out.algo = HashAlgo::Sha256;
            break;
        case 128:
            out.algo = HashAlgo::Sha512;
            break;
        case 32:
            out.algo = HashAlgo::Md5;
            break;
        default:
            return std::nullopt;
    }
    out.hex = to_lower(text);
    return out;
}

Expected<Checksum> computeFileDigest(const fs::path& file, HashAlgo algo) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Cannot open file for hashing: " + file.string()};
    }

    auto verifier = makeIntegrityVerifier(algo);
    std::vector<char> buf(1 << 16);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto got = in.gcount();
        if (got > 0) {
            verifier->update(std::span<const std::byte>(reinterpret_cast<const std::byte*>(buf.data()),
                                                        static_cast<std::size_t>(got)));
        }
    }
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Read failed while hashing: " + file.string()};
    }

    auto sum = verifier->finalize();
    if (sum.hex.empty()) {
        return Error{ErrorCode::Unknown, "Digest computation failed for " + file.string()};
    }
    return sum;
}

Expected<void> verifyFileChecksum(const fs::path& file, std::string_view expected) {
    if (expected.empty())
        return {};

    auto parsed = parseChecksum(expected);
    if (!parsed) {
        return Error{ErrorCode::InvalidArgument,
                     "Unrecognized checksum format: " + std::string(expected)};
    }

    auto actual = computeFileDigest(file, parsed->algo);
    if (!actual.ok())
        return actual.error();

    if (actual.value().hex == parsed->hex) {
        spdlog::debug("Checksum verified ({}) for {}", algo_name(parsed->algo), file.string());
        return {};
    }

    std::error_code ec;
    fs::remove(file, ec);
    if (ec) {
        spdlog::warn("Failed to delete file after checksum mismatch {}: {}", file.string(),
                     ec.message());
    }
    return Error{ErrorCode::ChecksumMismatch,
                 "Checksum mismatch: expected " + parsed->hex + ", got " + actual.value().hex};
}

} // namespace chartdl::downloader
