#include <gtest/gtest.h>

#include "tether/client/security.h"
#include "tether/common/error.h"
#include "test_certs.h"

using namespace tether;

class TransportSecurityTest : public ::testing::Test {
protected:
    void SetUp() override {
        certs_ = tether::testing::GenerateTestCertificates(dir_);
    }

    TlsConfig Tls() const {
        TlsConfig tls;
        tls.enabled = true;
        tls.ca_file = certs_.ca_file;
        return tls;
    }

    TlsConfig MutualTls() const {
        TlsConfig tls = Tls();
        tls.mtls = true;
        tls.cert_file = certs_.client_cert_file;
        tls.key_file = certs_.client_key_file;
        return tls;
    }

    tether::testing::TempDir dir_;
    tether::testing::TestCertificates certs_;
};

TEST_F(TransportSecurityTest, DisabledMeansPlaintext) {
    auto grpc = ResolveTransportSecurity(TlsConfig{}, Protocol::kGrpc);
    ASSERT_TRUE(grpc.ok()) << grpc.status();
    EXPECT_FALSE(grpc->tls);
    EXPECT_NE(grpc->grpc_credentials, nullptr);

    auto http = ResolveTransportSecurity(TlsConfig{}, Protocol::kHttp);
    ASSERT_TRUE(http.ok()) << http.status();
    EXPECT_FALSE(http->tls);
    EXPECT_EQ(http->ssl_context, nullptr);
}

TEST_F(TransportSecurityTest, DisabledIgnoresOtherFields) {
    TlsConfig tls;
    tls.insecure_verify = true;
    tls.cert_file = "/does/not/exist";
    EXPECT_TRUE(ResolveTransportSecurity(tls, Protocol::kGrpc).ok());
}

TEST_F(TransportSecurityTest, GrpcTls) {
    auto resolved = ResolveTransportSecurity(Tls(), Protocol::kGrpc);
    ASSERT_TRUE(resolved.ok()) << resolved.status();
    EXPECT_TRUE(resolved->tls);
    EXPECT_TRUE(resolved->verify_peer);
    EXPECT_FALSE(resolved->mutual);
    EXPECT_NE(resolved->grpc_credentials, nullptr);
}

TEST_F(TransportSecurityTest, GrpcMutualTls) {
    auto resolved = ResolveTransportSecurity(MutualTls(), Protocol::kGrpc);
    ASSERT_TRUE(resolved.ok()) << resolved.status();
    EXPECT_TRUE(resolved->mutual);
}

TEST_F(TransportSecurityTest, GrpcRejectsInsecureVerify) {
    for (TlsConfig tls : {Tls(), MutualTls()}) {
        tls.insecure_verify = true;
        auto resolved = ResolveTransportSecurity(tls, Protocol::kGrpc);
        ASSERT_FALSE(resolved.ok());
        EXPECT_EQ(GetErrorKind(resolved.status()), ErrorKind::kConfiguration);
    }
}

TEST_F(TransportSecurityTest, HttpHonoursInsecureVerify) {
    TlsConfig tls;
    tls.enabled = true;
    tls.insecure_verify = true;
    auto resolved = ResolveTransportSecurity(tls, Protocol::kHttp);
    ASSERT_TRUE(resolved.ok()) << resolved.status();
    EXPECT_TRUE(resolved->tls);
    EXPECT_FALSE(resolved->verify_peer);
    EXPECT_NE(resolved->ssl_context, nullptr);
}

TEST_F(TransportSecurityTest, HttpMutualTls) {
    auto resolved = ResolveTransportSecurity(MutualTls(), Protocol::kHttp);
    ASSERT_TRUE(resolved.ok()) << resolved.status();
    EXPECT_TRUE(resolved->mutual);
    EXPECT_TRUE(resolved->verify_peer);
    EXPECT_NE(resolved->ssl_context, nullptr);
}

TEST_F(TransportSecurityTest, MutualRequiresCertificateAndKey) {
    for (Protocol protocol : {Protocol::kGrpc, Protocol::kHttp}) {
        TlsConfig missing_both = Tls();
        missing_both.mtls = true;
        auto resolved = ResolveTransportSecurity(missing_both, protocol);
        ASSERT_FALSE(resolved.ok());
        EXPECT_EQ(GetErrorKind(resolved.status()), ErrorKind::kConfiguration);

        TlsConfig cert_only = Tls();
        cert_only.cert_file = certs_.client_cert_file;
        resolved = ResolveTransportSecurity(cert_only, protocol);
        ASSERT_FALSE(resolved.ok());
        EXPECT_EQ(GetErrorKind(resolved.status()), ErrorKind::kConfiguration);

        TlsConfig key_only = Tls();
        key_only.key_file = certs_.client_key_file;
        resolved = ResolveTransportSecurity(key_only, protocol);
        ASSERT_FALSE(resolved.ok());
        EXPECT_EQ(GetErrorKind(resolved.status()), ErrorKind::kConfiguration);
    }
}

TEST_F(TransportSecurityTest, CertificateAndKeyImplyMutual) {
    TlsConfig tls = MutualTls();
    tls.mtls = false;
    auto resolved = ResolveTransportSecurity(tls, Protocol::kHttp);
    ASSERT_TRUE(resolved.ok()) << resolved.status();
    EXPECT_TRUE(resolved->mutual);
}

TEST_F(TransportSecurityTest, UnreadableFilesAreConfigurationErrors) {
    for (Protocol protocol : {Protocol::kGrpc, Protocol::kHttp}) {
        TlsConfig missing_ca = Tls();
        missing_ca.ca_file = (dir_.GetPath() / "missing.pem").string();
        auto resolved = ResolveTransportSecurity(missing_ca, protocol);
        ASSERT_FALSE(resolved.ok());
        EXPECT_EQ(GetErrorKind(resolved.status()), ErrorKind::kConfiguration);

        TlsConfig garbage_key = MutualTls();
        garbage_key.key_file = dir_.Write("garbage.key", "not a key");
        resolved = ResolveTransportSecurity(garbage_key, protocol);
        ASSERT_FALSE(resolved.ok());
        EXPECT_EQ(GetErrorKind(resolved.status()), ErrorKind::kConfiguration);
    }
}
