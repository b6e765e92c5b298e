#include <spdf/Pl_SHA2.hh>

#include <spdf/SUtil.hh>

#include <gnutls/crypto.h>
#include <gnutls/gnutls.h>

#include <cstring>
#include <stdexcept>

class Pl_SHA2::Members
{
  public:
    Members() = default;
    Members(Members const&) = delete;
    ~Members()
    {
        finalize();
    }

    void
    init()
    {
        finalize();
        int code = gnutls_hash_init(&hash_ctx, GNUTLS_DIG_SHA256);
        if (code < 0) {
            hash_ctx = nullptr;
            throw std::runtime_error(
                std::string("gnutls: SHA256 error: ") + std::string(gnutls_strerror(code)));
        }
    }

    void
    finalize()
    {
        if (hash_ctx) {
            gnutls_hash_deinit(hash_ctx, digest);
            hash_ctx = nullptr;
        }
    }

    gnutls_hash_hd_t hash_ctx{nullptr};
    unsigned char digest[32]{};
    bool in_progress{false};
};

Pl_SHA2::Pl_SHA2(Pipeline* next) :
    Pipeline("sha2", next),
    m(std::make_unique<Members>())
{
    m->init();
}

Pl_SHA2::~Pl_SHA2() = default;

void
Pl_SHA2::write(unsigned char const* buf, size_t len)
{
    if (!m->hash_ctx) {
        throw std::logic_error("SHA2 pipeline written after finish without reset");
    }
    m->in_progress = true;
    // Write in chunks in case len is too big to fit in an int.
    static size_t const max_bytes = 1 << 30;
    size_t bytes_left = len;
    unsigned char const* data = buf;
    while (bytes_left > 0) {
        size_t bytes = (bytes_left >= max_bytes ? max_bytes : bytes_left);
        gnutls_hash(m->hash_ctx, data, bytes);
        bytes_left -= bytes;
        data += bytes;
    }

    if (next()) {
        next()->write(buf, len);
    }
}

void
Pl_SHA2::finish()
{
    if (next()) {
        next()->finish();
    }
    m->finalize();
    m->in_progress = false;
}

void
Pl_SHA2::reset()
{
    if (m->in_progress) {
        throw std::logic_error("reset requested for in-progress SHA2 Pipeline");
    }
    memset(m->digest, 0, sizeof(m->digest));
    m->init();
}

std::string
Pl_SHA2::getRawDigest()
{
    if (m->in_progress || m->hash_ctx) {
        throw std::logic_error("digest requested for in-progress SHA2 Pipeline");
    }
    return std::string(reinterpret_cast<char*>(m->digest), sizeof(m->digest));
}

std::string
Pl_SHA2::getHexDigest()
{
    return SUtil::hex_encode(getRawDigest());
}
