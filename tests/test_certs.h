#pragma once

#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include "test_support.h"

namespace tether::testing {

/// Throwaway PKI for TLS tests: a CA, a server certificate for localhost
/// and 127.0.0.1, and a client certificate, all signed by the CA.
struct TestCertificates {
    std::string ca_cert_pem;
    std::string server_cert_pem;
    std::string server_key_pem;
    std::string client_cert_pem;
    std::string client_key_pem;

    // The same material written to disk.
    std::string ca_file;
    std::string server_cert_file;
    std::string server_key_file;
    std::string client_cert_file;
    std::string client_key_file;
};

namespace detail {

struct KeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct CertDeleter {
    void operator()(X509* cert) const { X509_free(cert); }
};
struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};

using KeyPtr = std::unique_ptr<EVP_PKEY, KeyDeleter>;
using CertPtr = std::unique_ptr<X509, CertDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

inline void Check(int ok, const char* what) {
    if (ok <= 0) {
        throw std::runtime_error(std::string("OpenSSL failure: ") + what);
    }
}

inline KeyPtr GenerateKey() {
    KeyPtr key(EVP_EC_gen("prime256v1"));
    if (!key) {
        throw std::runtime_error("OpenSSL failure: EC key generation");
    }
    return key;
}

inline void AddExtension(X509* cert, X509V3_CTX* ctx, int nid, const char* value) {
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, ctx, nid, value);
    if (ext == nullptr) {
        throw std::runtime_error(std::string("OpenSSL failure: extension ") + value);
    }
    int ok = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    Check(ok, "X509_add_ext");
}

// |issuer| and |issuer_key| are null for the self-signed CA.
inline CertPtr MakeCertificate(EVP_PKEY* key, const char* common_name, long serial,
                               X509* issuer, EVP_PKEY* issuer_key, bool is_ca,
                               const char* subject_alt_name) {
    CertPtr cert(X509_new());
    Check(X509_set_version(cert.get(), 2), "X509_set_version");
    Check(ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), serial), "serial");
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), -3600);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 24L * 3600);
    Check(X509_set_pubkey(cert.get(), key), "X509_set_pubkey");

    X509_NAME* name = X509_get_subject_name(cert.get());
    Check(X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                     reinterpret_cast<const unsigned char*>(common_name),
                                     -1, -1, 0),
          "subject");
    Check(X509_set_issuer_name(cert.get(),
                               issuer ? X509_get_subject_name(issuer) : name),
          "issuer");

    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer ? issuer : cert.get(), cert.get(), nullptr, nullptr, 0);

    if (is_ca) {
        AddExtension(cert.get(), &ctx, NID_basic_constraints, "critical,CA:TRUE");
        AddExtension(cert.get(), &ctx, NID_key_usage, "critical,keyCertSign,cRLSign");
    } else {
        AddExtension(cert.get(), &ctx, NID_basic_constraints, "CA:FALSE");
        AddExtension(cert.get(), &ctx, NID_key_usage, "critical,digitalSignature");
        AddExtension(cert.get(), &ctx, NID_ext_key_usage, "serverAuth,clientAuth");
    }
    AddExtension(cert.get(), &ctx, NID_subject_key_identifier, "hash");
    if (subject_alt_name != nullptr) {
        AddExtension(cert.get(), &ctx, NID_subject_alt_name, subject_alt_name);
    }

    Check(X509_sign(cert.get(), issuer_key ? issuer_key : key, EVP_sha256()), "X509_sign");
    return cert;
}

inline std::string ToPem(X509* cert) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    Check(PEM_write_bio_X509(bio.get(), cert), "PEM_write_bio_X509");
    char* data = nullptr;
    long size = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(size));
}

inline std::string ToPem(EVP_PKEY* key) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    Check(PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr),
          "PEM_write_bio_PrivateKey");
    char* data = nullptr;
    long size = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(size));
}

}  // namespace detail

inline TestCertificates GenerateTestCertificates(const TempDir& dir) {
    using namespace detail;

    KeyPtr ca_key = GenerateKey();
    CertPtr ca = MakeCertificate(ca_key.get(), "tether test CA", 1, nullptr, nullptr, true,
                                 nullptr);

    KeyPtr server_key = GenerateKey();
    CertPtr server = MakeCertificate(server_key.get(), "localhost", 2, ca.get(), ca_key.get(),
                                     false, "DNS:localhost,IP:127.0.0.1");

    KeyPtr client_key = GenerateKey();
    CertPtr client = MakeCertificate(client_key.get(), "tether test client", 3, ca.get(),
                                     ca_key.get(), false, nullptr);

    TestCertificates certs;
    certs.ca_cert_pem = ToPem(ca.get());
    certs.server_cert_pem = ToPem(server.get());
    certs.server_key_pem = ToPem(server_key.get());
    certs.client_cert_pem = ToPem(client.get());
    certs.client_key_pem = ToPem(client_key.get());

    certs.ca_file = dir.Write("ca.pem", certs.ca_cert_pem);
    certs.server_cert_file = dir.Write("server.pem", certs.server_cert_pem);
    certs.server_key_file = dir.Write("server.key", certs.server_key_pem);
    certs.client_cert_file = dir.Write("client.pem", certs.client_cert_pem);
    certs.client_key_file = dir.Write("client.key", certs.client_key_pem);
    return certs;
}

}  // namespace tether::testing
