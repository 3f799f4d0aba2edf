// SPDX-License-Identifier: MIT

// tests/tls_test_util.hpp
#pragma once

#include <gtest/gtest.h>

#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <csignal>
#include <cstring>
#include <thread>

#include "tests/test_util.hpp"

namespace sockstream::testing {

// Two SSL objects with a completed handshake over a socketpair.
//
// The server uses a throwaway self-signed certificate generated in memory;
// the client does not verify it. Session tickets are disabled unless
// requested; with them on, the server's NewSessionTicket records sit unread
// in the client's socket after the handshake.
class TlsPair {
public:
    explicit TlsPair(bool session_tickets = false) {
        // OpenSSL writes with write(2); a closed peer must not kill the test
        std::signal(SIGPIPE, SIG_IGN);

        pkey_ = EVP_EC_gen("P-256");
        EXPECT_NE(pkey_, nullptr);
        cert_ = MakeSelfSignedCert(pkey_);
        EXPECT_NE(cert_, nullptr);

        server_ctx_ = SSL_CTX_new(TLS_server_method());
        EXPECT_EQ(SSL_CTX_use_certificate(server_ctx_, cert_), 1);
        EXPECT_EQ(SSL_CTX_use_PrivateKey(server_ctx_, pkey_), 1);
        if (!session_tickets) SSL_CTX_set_num_tickets(server_ctx_, 0);

        client_ctx_ = SSL_CTX_new(TLS_client_method());
        SSL_CTX_set_verify(client_ctx_, SSL_VERIFY_NONE, nullptr);

        server_ = SSL_new(server_ctx_);
        client_ = SSL_new(client_ctx_);
        SSL_set_fd(server_, sockets_.first());
        SSL_set_fd(client_, sockets_.second());

        int server_ret = 0;
        std::thread server_thread([&] { server_ret = SSL_accept(server_); });
        int client_ret = SSL_connect(client_);
        server_thread.join();

        EXPECT_EQ(client_ret, 1);
        EXPECT_EQ(server_ret, 1);
    }

    ~TlsPair() {
        SSL_free(client_);
        SSL_free(server_);
        SSL_CTX_free(client_ctx_);
        SSL_CTX_free(server_ctx_);
        X509_free(cert_);
        EVP_PKEY_free(pkey_);
    }

    TlsPair(const TlsPair&) = delete;
    TlsPair& operator=(const TlsPair&) = delete;

    SSL* server() const { return server_; }
    SSL* client() const { return client_; }

    // Drop the server's socket without a close_notify
    void CloseServerSocket() { sockets_.CloseFirst(); }

private:
    static X509* MakeSelfSignedCert(EVP_PKEY* pkey) {
        X509* cert = X509_new();
        if (!cert) return nullptr;

        X509_set_version(cert, 2);
        ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert), 0);
        X509_gmtime_adj(X509_getm_notAfter(cert), 3600);
        X509_set_pubkey(cert, pkey);

        X509_NAME* name = X509_get_subject_name(cert);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("localhost"),
                                   -1, -1, 0);
        X509_set_issuer_name(cert, name);

        if (X509_sign(cert, pkey, EVP_sha256()) == 0) {
            X509_free(cert);
            return nullptr;
        }
        return cert;
    }

    SocketPair sockets_;
    EVP_PKEY* pkey_ = nullptr;
    X509* cert_ = nullptr;
    SSL_CTX* server_ctx_ = nullptr;
    SSL_CTX* client_ctx_ = nullptr;
    SSL* server_ = nullptr;
    SSL* client_ = nullptr;
};

}  // namespace sockstream::testing
