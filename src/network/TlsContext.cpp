#include "edgelog/network/TlsContext.h"
#include "edgelog/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace edgelog {
namespace network {

TlsContext::TlsContext() {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
}

TlsContext::~TlsContext() {
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }
}

bool TlsContext::InitClient(bool verifyPeer) {
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }

    SSL_CTX* c = SSL_CTX_new(TLS_client_method());
    if (!c) {
        LOG_ERROR << "TLS: SSL_CTX_new failed";
        return false;
    }

    SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
    SSL_CTX_set_options(c, SSL_OP_NO_COMPRESSION);
    // TcpConnection retries writes from a Buffer that may move between attempts.
    SSL_CTX_set_mode(c, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    if (verifyPeer) {
        if (SSL_CTX_set_default_verify_paths(c) != 1) {
            LOG_WARN << "TLS: cannot load default trust store";
        }
        SSL_CTX_set_verify(c, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(c, SSL_VERIFY_NONE, nullptr);
    }

    ctx_ = reinterpret_cast<ssl_ctx_st*>(c);
    verifyPeer_ = verifyPeer;
    return true;
}

} // namespace network
} // namespace edgelog
