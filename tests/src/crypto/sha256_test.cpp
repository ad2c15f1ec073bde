#include <gtest/gtest.h>
#include <auditchain/crypto/sha256.hpp>

#include <string_view>

TEST(sha256, matches_known_vectors) {
  EXPECT_EQ(auditchain::schema::to_hex(
                auditchain::crypto::sha256::hash(std::string_view{"abc"})),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(auditchain::schema::to_hex(
                auditchain::crypto::sha256::hash(std::string_view{""})),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(sha256, incremental_updates_match_one_shot) {
  auto incremental = auditchain::crypto::sha256{}
                         .update(std::string_view{"a"})
                         .update(std::string_view{"bc"})
                         .finalize();
  EXPECT_EQ(incremental,
            auditchain::crypto::sha256::hash(std::string_view{"abc"}));
}

TEST(sha256, byte_and_string_inputs_agree) {
  auto bytes = auditchain::schema::bytes_t{'a', 'b', 'c'};
  EXPECT_EQ(auditchain::crypto::sha256::hash(
                auditchain::schema::make_bytes_view(bytes)),
            auditchain::crypto::sha256::hash(std::string_view{"abc"}));
}
