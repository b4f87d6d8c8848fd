#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

// Validation failures raised by Chaskey-LTS permutation, counter mode and
// cipher facade
namespace chaskey {

// Common base of every error thrown by this library, so that callers can catch
// them all at once
class error : public std::runtime_error
{
public:
  explicit error(const std::string& msg)
    : std::runtime_error(msg)
  {}
};

// Key, block or nonce is not exactly as long as it must be
class invalid_length : public error
{
public:
  invalid_length(const std::string& arg, // which argument was rejected
                 const size_t expected,  // required byte length
                 const size_t actual     // byte length provided by caller
                 )
    : error(arg + " must be " + std::to_string(expected) + " -bytes, but got " +
            std::to_string(actual) + " -bytes")
    , expected_len(expected)
    , actual_len(actual)
  {}

  size_t expected() const noexcept { return expected_len; }
  size_t actual() const noexcept { return actual_len; }

private:
  size_t expected_len;
  size_t actual_len;
};

// Requested cipher mode is either unknown or not implemented
class unsupported_mode : public error
{
public:
  explicit unsupported_mode(const std::string& msg)
    : error(msg)
  {}
};

// CTR mode was requested without an initial counter value
class missing_nonce : public error
{
public:
  missing_nonce()
    : error("CTR mode requires a nonce")
  {}
};

// CTR mode nonce was supplied, but it is not a byte sequence
class invalid_nonce_type : public error
{
public:
  invalid_nonce_type()
    : error("CTR mode nonce must be a byte sequence")
  {}
};

// Encryption/ decryption was invoked on an instance which holds no counter,
// i.e. one which has been moved from
class missing_counter_state : public error
{
public:
  missing_counter_state()
    : error("must have a nonce to encrypt in CTR mode")
  {}
};

}
