#include "chaskey_ctr.hpp"
#include "utils.hpp"
#include <gtest/gtest.h>
#include <string>
#include <string_view>

using chaskey_ctr::bytes_t;
using chaskey_ctr::cipher_t;
using chaskey_ctr::mode_arg_t;

namespace {

bytes_t
bytes_of(const std::string_view s)
{
  return bytes_t(s.begin(), s.end());
}

class CipherTest : public ::testing::Test
{
protected:
  const bytes_t key = bytes_of("0123456789012345");
  const bytes_t nonce = bytes_of("0000000000000000");

  std::vector<mode_arg_t> ctr_args() const { return { mode_arg_t(nonce) }; }
};

}

TEST_F(CipherTest, EncryptKnownAnswer)
{
  cipher_t c("ctr", key, ctr_args());
  EXPECT_EQ(c.encrypt(bytes_of("foo")), from_hex("2bdad6"));
}

TEST_F(CipherTest, DecryptKnownAnswer)
{
  cipher_t c("ctr", key, ctr_args());
  EXPECT_EQ(c.decrypt(from_hex("2bdad6")), bytes_of("foo"));
}

TEST_F(CipherTest, ModeNameIsCaseInsensitive)
{
  for (const std::string_view mode : { "CTR", "Ctr", "cTr" }) {
    cipher_t c(mode, key, ctr_args());
    EXPECT_EQ(c.encrypt(bytes_of("foo")), from_hex("2bdad6")) << mode;
  }

  EXPECT_EQ(chaskey_ctr::parse_mode("CTR"), chaskey_ctr::cipher_mode_t::ctr);
}

TEST_F(CipherTest, CounterPersistsAcrossCalls)
{
  cipher_t c("ctr", key, ctr_args());

  const auto enc0 = c.encrypt(bytes_of("foo"));
  const auto cnt = c.counter();
  EXPECT_EQ(to_hex(cnt.data(), cnt.size()), "30303030303030303030303030303031");

  // same plain text, but next counter value, so different cipher text
  const auto enc1 = c.encrypt(bytes_of("foo"));
  EXPECT_NE(enc0, enc1);

  const auto cnt1 = c.counter();
  EXPECT_EQ(to_hex(cnt1.data(), cnt1.size()),
            "30303030303030303030303030303032");
}

TEST_F(CipherTest, FreshInstanceDecryptsMessagesInOrder)
{
  bytes_t txt0(40);
  bytes_t txt1(7);
  random_data(txt0.data(), txt0.size());
  random_data(txt1.data(), txt1.size());

  cipher_t sender("ctr", key, ctr_args());
  const auto enc0 = sender.encrypt(txt0);
  const auto enc1 = sender.encrypt(txt1);

  cipher_t receiver("ctr", key, ctr_args());
  EXPECT_EQ(receiver.decrypt(enc0), txt0);
  EXPECT_EQ(receiver.decrypt(enc1), txt1);
  EXPECT_EQ(receiver.counter(), sender.counter());
}

TEST_F(CipherTest, EmptyInputKeepsCounter)
{
  cipher_t c("ctr", key, ctr_args());
  const auto before = c.counter();

  EXPECT_TRUE(c.encrypt({}).empty());
  EXPECT_EQ(c.counter(), before);
}

TEST_F(CipherTest, RejectsUnimplementedModes)
{
  for (const std::string_view mode :
       { "ecb", "cbc", "ofb", "cfb", "cfb8", "gcm", "ECB", "Gcm" }) {
    EXPECT_THROW(cipher_t(mode, key, ctr_args()), chaskey::unsupported_mode)
      << mode;
  }
}

TEST_F(CipherTest, RejectsUnknownModes)
{
  for (const std::string_view mode : { "", "xyz", "ctr ", "cfb16" }) {
    EXPECT_THROW(cipher_t(mode, key, ctr_args()), chaskey::unsupported_mode)
      << mode;
  }
}

TEST_F(CipherTest, ModeIsCheckedBeforeArguments)
{
  EXPECT_THROW(cipher_t("cbc", bytes_t{}), chaskey::unsupported_mode);
}

TEST_F(CipherTest, RejectsMissingNonce)
{
  EXPECT_THROW(cipher_t("ctr", key), chaskey::missing_nonce);
  EXPECT_THROW(cipher_t("ctr", key, {}), chaskey::missing_nonce);
}

TEST_F(CipherTest, RejectsNonByteNonce)
{
  const std::string text_nonce = "0000000000000000";
  const std::vector<mode_arg_t> args{ mode_arg_t(text_nonce) };
  EXPECT_THROW(cipher_t("ctr", key, args), chaskey::invalid_nonce_type);
}

TEST_F(CipherTest, RejectsNonceOfWrongLength)
{
  const std::vector<mode_arg_t> args{ mode_arg_t(bytes_t(15, 0)) };

  try {
    cipher_t c("ctr", key, args);
    FAIL() << "expected invalid_length";
  } catch (const chaskey::invalid_length& e) {
    EXPECT_EQ(e.expected(), 16ul);
    EXPECT_EQ(e.actual(), 15ul);
  }
}

TEST_F(CipherTest, RejectsKeyOfWrongLength)
{
  EXPECT_THROW(cipher_t("ctr", bytes_t(15, 0), ctr_args()),
               chaskey::invalid_length);
  EXPECT_THROW(cipher_t("ctr", bytes_t(32, 0), ctr_args()),
               chaskey::invalid_length);
}

TEST_F(CipherTest, IgnoresArgumentsAfterNonce)
{
  const std::vector<mode_arg_t> args{ mode_arg_t(nonce),
                                      mode_arg_t(std::string("tag")) };

  cipher_t c("ctr", key, args);
  EXPECT_EQ(c.encrypt(bytes_of("foo")), from_hex("2bdad6"));
}

TEST_F(CipherTest, MovedFromInstanceHasNoCounterState)
{
  cipher_t c0("ctr", key, ctr_args());
  c0.encrypt(bytes_of("foo"));

  cipher_t c1(std::move(c0));

  EXPECT_THROW(c0.encrypt(bytes_of("foo")), chaskey::missing_counter_state);
  EXPECT_THROW(c0.decrypt(bytes_of("foo")), chaskey::missing_counter_state);
  EXPECT_THROW(c0.counter(), chaskey::missing_counter_state);

  // moved-to instance continues from where c0 left off
  const auto cnt = c1.counter();
  EXPECT_EQ(to_hex(cnt.data(), cnt.size()), "30303030303030303030303030303031");

  cipher_t c2("ctr", key, ctr_args());
  c2 = std::move(c1);
  EXPECT_THROW(c1.encrypt(bytes_of("foo")), chaskey::missing_counter_state);
  EXPECT_EQ(c2.counter(), cnt);
}

TEST_F(CipherTest, EveryErrorSharesCommonBase)
{
  EXPECT_THROW(cipher_t("ecb", key), chaskey::error);
  EXPECT_THROW(cipher_t("ctr", key), chaskey::error);
  EXPECT_THROW(cipher_t("ctr", bytes_t{}, ctr_args()), std::runtime_error);
}
