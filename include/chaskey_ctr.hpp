#pragma once
#include "ctr.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// Chaskey-LTS cipher, operated in counter mode
namespace chaskey_ctr {

using bytes_t = std::vector<uint8_t>;

// Cipher modes which are actually implemented
enum class cipher_mode_t
{
  ctr
};

// Mode specific argument; only byte sequences are accepted as nonce, anything
// else ( say a text string ) is rejected
using mode_arg_t = std::variant<bytes_t, std::string>;

// Mode names which are recognized, but have no implementation
constexpr std::string_view UNIMPLEMENTED_MODES[]{ "ecb", "cbc",  "ofb",
                                                  "cfb", "cfb8", "gcm" };

// Given a cipher mode name ( case insensitive ), this routine returns the
// matching mode, throwing `unsupported_mode` for anything other than "ctr"
static cipher_mode_t
parse_mode(const std::string_view name)
{
  std::string lname;
  lname.reserve(name.size());

  for (const char c : name) {
    lname.push_back(
      static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lname == "ctr") {
    return cipher_mode_t::ctr;
  }

  for (const auto m : UNIMPLEMENTED_MODES) {
    if (lname == m) {
      throw chaskey::unsupported_mode("mode '" + lname +
                                      "' is not implemented");
    }
  }

  throw chaskey::unsupported_mode("unknown mode '" + std::string(name) + "'");
}

// Chaskey-LTS cipher instance, owning a 16 -bytes secret key and the state of
// the selected mode
//
// In counter mode, state is the 128 -bit big endian counter, which keeps
// advancing across encrypt/ decrypt calls, so no two calls on the same
// instance reuse key stream.
//
// Instances are move-only; moved-from instance holds no mode state and refuses
// to encrypt/ decrypt. Not safe for concurrent use.
class cipher_t
{
public:
  // Validates mode & its arguments, throwing
  //
  // - `unsupported_mode` for any mode but "ctr"
  // - `invalid_length` if key is not 16 -bytes
  // - `missing_nonce` if "ctr" gets no argument
  // - `invalid_nonce_type` if first argument is not a byte sequence
  // - `invalid_length` if nonce is not 16 -bytes
  //
  // Arguments after the nonce are ignored.
  cipher_t(const std::string_view mode,
           const bytes_t& key,
           const std::vector<mode_arg_t>& args = {})
  {
    switch (parse_mode(mode)) {
      case cipher_mode_t::ctr: {
        if (key.size() != chaskey::KEY_LEN) {
          throw chaskey::invalid_length("key", chaskey::KEY_LEN, key.size());
        }
        if (args.empty()) {
          throw chaskey::missing_nonce();
        }

        const bytes_t* const nonce = std::get_if<bytes_t>(&args[0]);
        if (nonce == nullptr) {
          throw chaskey::invalid_nonce_type();
        }
        if (nonce->size() != ctr::COUNTER_LEN) {
          throw chaskey::invalid_length(
            "nonce", ctr::COUNTER_LEN, nonce->size());
        }

        ctr_state_t st{};
        std::copy(nonce->begin(), nonce->end(), st.counter.begin());
        std::copy(key.begin(), key.end(), this->key.begin());

        state = st;
        break;
      }
    }
  }

  cipher_t(const cipher_t&) = delete;
  cipher_t& operator=(const cipher_t&) = delete;

  cipher_t(cipher_t&& other) noexcept
    : key(other.key)
    , state(std::exchange(other.state, std::monostate{}))
  {
    other.key.fill(0);
  }

  cipher_t& operator=(cipher_t&& other) noexcept
  {
    if (this != &other) {
      key = other.key;
      state = std::exchange(other.state, std::monostate{});
      other.key.fill(0);
    }
    return *this;
  }

  ~cipher_t() { key.fill(0); }

  // Encrypts N -bytes plain text to N -bytes cipher text, advancing counter by
  // ceil(N / 16)
  bytes_t encrypt(const bytes_t& data) { return apply(data); }

  // Decrypts N -bytes cipher text to N -bytes plain text; same operation as
  // `encrypt`, because counter mode is self-inverse
  bytes_t decrypt(const bytes_t& data) { return apply(data); }

  // Current value of 128 -bit big endian counter i.e. the one which will be
  // used for next key stream block
  std::array<uint8_t, ctr::COUNTER_LEN> counter() const
  {
    const auto* const st = std::get_if<ctr_state_t>(&state);
    if (st == nullptr) {
      throw chaskey::missing_counter_state();
    }
    return st->counter;
  }

private:
  // Counter mode state always carries its counter
  struct ctr_state_t
  {
    std::array<uint8_t, ctr::COUNTER_LEN> counter;
  };

  bytes_t apply(const bytes_t& data)
  {
    auto* const st = std::get_if<ctr_state_t>(&state);
    if (st == nullptr) {
      throw chaskey::missing_counter_state();
    }

    bytes_t out(data.size());
    ctr::apply(key.data(),
               key.size(),
               st->counter.data(),
               data.data(),
               out.data(),
               data.size());
    return out;
  }

  std::array<uint8_t, chaskey::KEY_LEN> key{};
  std::variant<std::monostate, ctr_state_t> state;
};

}
