#include "chaskey_ctr.hpp"
#include "utils.hpp"
#include <cassert>
#include <cstdlib>
#include <iostream>

// Compile it with
//
// g++ -std=c++20 -Wall -Wextra -O3 -march=native -I ./include example/main.cpp
int
main()
{
  using namespace chaskey_ctr;

  bytes_t key(chaskey::KEY_LEN);   // secret key
  bytes_t nonce(ctr::COUNTER_LEN); // initial counter value
  bytes_t txt0(32);               // plain text of first message
  bytes_t txt1(21);               // plain text of second message

  random_data(key.data(), key.size());
  random_data(nonce.data(), nonce.size());
  random_data(txt0.data(), txt0.size());
  random_data(txt1.data(), txt1.size());

  // counter keeps advancing across calls, so second message gets fresh key
  // stream
  cipher_t enc_cipher("ctr", key, { nonce });
  const bytes_t enc0 = enc_cipher.encrypt(txt0);
  const bytes_t enc1 = enc_cipher.encrypt(txt1);

  // receiver starts from same nonce and decrypts messages in same order
  cipher_t dec_cipher("ctr", key, { nonce });
  const bytes_t dec0 = dec_cipher.decrypt(enc0);
  const bytes_t dec1 = dec_cipher.decrypt(enc1);

  assert(dec0 == txt0);
  assert(dec1 == txt1);

  const auto cnt = enc_cipher.counter();

  std::cout << "Chaskey-LTS ( CTR mode )" << std::endl << std::endl;
  std::cout << "Key         : " << to_hex(key.data(), key.size()) << std::endl;
  std::cout << "Nonce       : " << to_hex(nonce.data(), nonce.size())
            << std::endl;
  std::cout << "Text 0      : " << to_hex(txt0.data(), txt0.size()) << std::endl;
  std::cout << "Encrypted 0 : " << to_hex(enc0.data(), enc0.size()) << std::endl;
  std::cout << "Decrypted 0 : " << to_hex(dec0.data(), dec0.size()) << std::endl;
  std::cout << "Text 1      : " << to_hex(txt1.data(), txt1.size()) << std::endl;
  std::cout << "Encrypted 1 : " << to_hex(enc1.data(), enc1.size()) << std::endl;
  std::cout << "Decrypted 1 : " << to_hex(dec1.data(), dec1.size()) << std::endl;
  std::cout << "Counter     : " << to_hex(cnt.data(), cnt.size()) << std::endl;

  // unsupported modes are rejected before any cryptographic work is done
  try {
    cipher_t c("cbc", key, { nonce });
  } catch (const chaskey::unsupported_mode& e) {
    std::cout << std::endl << "Rejected    : " << e.what() << std::endl;
  }

  return EXIT_SUCCESS;
}
