#include <pledge/crypto/verify.hpp>
#include <pledge/testing/ed25519_key.hpp>
#include <gtest/gtest.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <array>
#include <vector>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

TEST(crypto_verify, verifies_ed25519_signatures) {
  if (!pledge::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto key = pledge::testing::ed25519_key::generate();
  ASSERT_TRUE(key.has_value());

  auto message = std::vector<uint8_t>{'p', 'l', 'e', 'd', 'g', 'e'};
  auto signature = key->sign(pledge::schema::make_bytes_view(message));
  EXPECT_TRUE(pledge::crypto::verify_signature(
      pledge::schema::make_bytes_view(message), key->address(),
      pledge::schema::signature_t{signature}));

  message[0] ^= 0x01;
  EXPECT_FALSE(pledge::crypto::verify_signature(
      pledge::schema::make_bytes_view(message), key->address(),
      pledge::schema::signature_t{signature}));
}

TEST(crypto_verify, rejects_signature_from_other_key) {
  if (!pledge::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto signer = pledge::testing::ed25519_key::generate();
  auto other = pledge::testing::ed25519_key::generate();
  ASSERT_TRUE(signer.has_value());
  ASSERT_TRUE(other.has_value());

  auto message = std::vector<uint8_t>{'m', 's', 'g'};
  auto signature = signer->sign(pledge::schema::make_bytes_view(message));
  EXPECT_FALSE(pledge::crypto::verify_signature(
      pledge::schema::make_bytes_view(message), other->address(),
      pledge::schema::signature_t{signature}));
}

TEST(crypto_verify, verifies_secp256k1_signatures) {
  if (!pledge::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto *ec_key = EC_KEY_new_by_curve_name(NID_secp256k1);
  ASSERT_NE(ec_key, nullptr);
  ASSERT_EQ(EC_KEY_generate_key(ec_key), 1);
  EC_KEY_set_conv_form(ec_key, POINT_CONVERSION_COMPRESSED);

  auto compressed = std::array<uint8_t, 33>{};
  auto *pub_ptr = compressed.data();
  ASSERT_EQ(i2o_ECPublicKey(ec_key, &pub_ptr),
            static_cast<int>(compressed.size()));

  auto *pkey = EVP_PKEY_new();
  ASSERT_NE(pkey, nullptr);
  ASSERT_EQ(EVP_PKEY_assign_EC_KEY(pkey, ec_key), 1);

  auto message = std::vector<uint8_t>{'s', 'e', 'c', 'p'};
  auto *sign_ctx = EVP_MD_CTX_new();
  ASSERT_NE(sign_ctx, nullptr);
  ASSERT_EQ(EVP_DigestSignInit(sign_ctx, nullptr, EVP_sha256(), nullptr, pkey),
            1);
  auto der_size = size_t{};
  ASSERT_EQ(EVP_DigestSign(sign_ctx, nullptr, &der_size, message.data(),
                           message.size()),
            1);
  auto der = std::vector<uint8_t>(der_size);
  ASSERT_EQ(EVP_DigestSign(sign_ctx, der.data(), &der_size, message.data(),
                           message.size()),
            1);
  EVP_MD_CTX_free(sign_ctx);

  const auto *der_ptr = static_cast<const unsigned char *>(der.data());
  auto *sig = d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size));
  ASSERT_NE(sig, nullptr);
  const auto *r = static_cast<const BIGNUM *>(nullptr);
  const auto *s = static_cast<const BIGNUM *>(nullptr);
  ECDSA_SIG_get0(sig, &r, &s);

  auto compact = pledge::schema::secp256k1_signature_t{};
  compact[0] = 0;
  ASSERT_EQ(BN_bn2binpad(r, compact.data() + 1, 32), 32);
  ASSERT_EQ(BN_bn2binpad(s, compact.data() + 33, 32), 32);
  ECDSA_SIG_free(sig);

  auto signer = pledge::schema::secp256k1_signer_id{.public_key = compressed};
  EXPECT_TRUE(pledge::crypto::verify_signature(
      pledge::schema::make_bytes_view(message),
      pledge::schema::signer_id_t{signer},
      pledge::schema::signature_t{compact}));

  message[0] ^= 0x01;
  EXPECT_FALSE(pledge::crypto::verify_signature(
      pledge::schema::make_bytes_view(message),
      pledge::schema::signer_id_t{signer},
      pledge::schema::signature_t{compact}));

  EVP_PKEY_free(pkey);
}

TEST(crypto_verify, rejects_mismatched_signer_and_signature_variants) {
  auto ed_signer = pledge::schema::ed25519_signer_id{};
  ed_signer.public_key[0] = 1;
  auto secp_signature = pledge::schema::secp256k1_signature_t{};

  EXPECT_FALSE(pledge::crypto::verify_signature(
      pledge::schema::bytes_view_t{}, pledge::schema::signer_id_t{ed_signer},
      pledge::schema::signature_t{secp_signature}));
}

TEST(crypto_verify, rejects_contract_identity_signatures) {
  auto named = pledge::schema::named_signer_t{};
  named[0] = 0x42;
  auto message = std::array<uint8_t, 3>{'a', 'b', 'c'};
  EXPECT_FALSE(pledge::crypto::verify_signature(
      pledge::schema::bytes_view_t{message.data(), message.size()},
      pledge::schema::signer_id_t{named},
      pledge::schema::signature_t{pledge::schema::ed25519_signature_t{}}));
}

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif
