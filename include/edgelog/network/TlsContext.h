#pragma once

#include "edgelog/common/noncopyable.h"

struct ssl_ctx_st;

namespace edgelog {
namespace network {

// Client-side SSL_CTX for backend connections.
class TlsContext : edgelog::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    // verifyPeer: validate the chain against the system trust store.
    bool InitClient(bool verifyPeer);
    ssl_ctx_st* ctx() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }
    bool verifyPeer() const { return verifyPeer_; }

private:
    ssl_ctx_st* ctx_{nullptr};
    bool verifyPeer_{false};
};

} // namespace network
} // namespace edgelog
