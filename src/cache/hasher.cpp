#include "hasher.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <openssl/evp.h>
#include <fmt/format.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <system_error>

TrackedInputSet& TrackedInputSet::add(const fs::path& path) {
    paths_.insert(normalize_path(path));
    return *this;
}

TrackedInputSet& TrackedInputSet::add_required(const fs::path& path) {
    fs::path p = normalize_path(path);
    paths_.insert(p);
    required_.insert(p);
    return *this;
}

TrackedInputSet& TrackedInputSet::add_all(const std::vector<fs::path>& paths) {
    for (const auto& p : paths) add(p);
    return *this;
}

bool TrackedInputSet::is_required(const fs::path& path) const {
    return required_.count(normalize_path(path)) > 0;
}

// ── Digest plumbing ─────────────────────────────────────────

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("OpenSSL: cannot initialise SHA-256");
        }
    }

    void update(const void* data, size_t len) {
        if (len == 0) return;
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
            throw std::runtime_error("OpenSSL: SHA-256 update failed");
        }
    }

    void update(const std::string& s) { update(s.data(), s.size()); }

    // Fixed-width little-endian length so framing is unambiguous.
    void update_length(uint64_t n) {
        unsigned char buf[8];
        for (int i = 0; i < 8; ++i) buf[i] = static_cast<unsigned char>(n >> (8 * i));
        update(buf, sizeof(buf));
    }

    std::string hex() {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest, &len) != 1) {
            throw std::runtime_error("OpenSSL: SHA-256 final failed");
        }
        std::string out;
        out.reserve(len * 2);
        for (unsigned int i = 0; i < len; ++i) {
            out += fmt::format("{:02x}", digest[i]);
        }
        return out;
    }

private:
    MdCtx ctx_;
};

// Member tags
constexpr char TAG_FILE   = 'F';
constexpr char TAG_ABSENT = 'A';
constexpr char TAG_DIR    = 'D';

} // namespace

std::string sha256_hex(const std::string& data) {
    Sha256 sha;
    sha.update(data);
    return sha.hex();
}

// Each member is framed as: path NUL tag [length content]
Result<Fingerprint, GenError> fingerprint(const TrackedInputSet& inputs) {
    using R = Result<Fingerprint, GenError>;

    Sha256 sha;
    sha.update(std::string(FINGERPRINT_DOMAIN));
    sha.update_length(inputs.size());

    for (const auto& path : inputs.paths()) {
        std::string name = path.generic_string();
        sha.update(name);
        sha.update("\0", 1);

        std::error_code ec;
        auto status = fs::status(path, ec);
        if (status.type() != fs::file_type::not_found && ec) {
            return R::Err(GenError::hashing(path, ec.message()));
        }
        if (!fs::exists(status)) {
            if (inputs.is_required(path)) {
                return R::Err(GenError::hashing(path, "required seed file is missing"));
            }
            sha.update(&TAG_ABSENT, 1);
            continue;
        }

        if (fs::is_directory(status)) {
            sha.update(&TAG_DIR, 1);
            continue;
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return R::Err(GenError::hashing(path, std::strerror(errno)));
        }

        auto size = fs::file_size(path, ec);
        if (ec) {
            return R::Err(GenError::hashing(path, ec.message()));
        }
        sha.update(&TAG_FILE, 1);
        sha.update_length(static_cast<uint64_t>(size));

        char buffer[8192];
        uint64_t total = 0;
        while (in.read(buffer, sizeof(buffer)) || in.gcount() > 0) {
            sha.update(buffer, static_cast<size_t>(in.gcount()));
            total += static_cast<uint64_t>(in.gcount());
        }
        if (in.bad()) {
            return R::Err(GenError::hashing(path, "read error"));
        }
        // File changed size while being read; the stamped length would lie.
        if (total != static_cast<uint64_t>(size)) {
            return R::Err(GenError::hashing(path, "file changed while hashing"));
        }
    }

    return R::Ok(Fingerprint{sha.hex()});
}
