/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/multi/base58.hpp>

#include <algorithm>
#include <array>

namespace {
  // All alphanumeric characters except for "0", "I", "O", and "l"
  constexpr std::string_view kAlphabet =
      "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

  constexpr std::array<int8_t, 256> makeIndex() {
    std::array<int8_t, 256> index{};
    index.fill(-1);
    for (size_t i = 0; i < kAlphabet.size(); ++i) {
      index.at(static_cast<uint8_t>(kAlphabet[i])) = static_cast<int8_t>(i);
    }
    return index;
  }

  constexpr auto kIndex = makeIndex();
}  // namespace

namespace peerscout::multi::detail {

  std::string encodeBase58(BytesIn bytes) {
    auto begin = bytes.begin();
    auto end = bytes.end();

    // leading zero bytes are encoded as '1' each
    size_t zeroes = 0;
    while (begin != end and *begin == 0) {
      ++begin;
      ++zeroes;
    }

    // big-endian base58 digits, log(256) / log(58) rounded up
    std::vector<uint8_t> digits(
        static_cast<size_t>(std::distance(begin, end)) * 138 / 100 + 1);
    size_t length = 0;
    for (; begin != end; ++begin) {
      int carry = *begin;
      size_t i = 0;
      for (auto it = digits.rbegin();
           (carry != 0 or i < length) and it != digits.rend();
           ++it, ++i) {
        carry += 256 * (*it);
        *it = static_cast<uint8_t>(carry % 58);
        carry /= 58;
      }
      length = i;
    }

    auto it = digits.begin() + static_cast<long>(digits.size() - length);
    while (it != digits.end() and *it == 0) {
      ++it;
    }

    std::string result(zeroes, '1');
    result.reserve(zeroes + static_cast<size_t>(digits.end() - it));
    for (; it != digits.end(); ++it) {
      result += kAlphabet[*it];
    }
    return result;
  }

  outcome::result<Bytes> decodeBase58(std::string_view string) {
    auto begin = string.begin();
    auto end = string.end();

    size_t zeroes = 0;
    while (begin != end and *begin == '1') {
      ++begin;
      ++zeroes;
    }

    // big-endian base256 digits, log(58) / log(256) rounded up
    std::vector<uint8_t> bytes(
        static_cast<size_t>(std::distance(begin, end)) * 733 / 1000 + 1);
    size_t length = 0;
    for (; begin != end; ++begin) {
      int carry = kIndex.at(static_cast<uint8_t>(*begin));
      if (carry < 0) {
        return BaseError::INVALID_BASE58_INPUT;
      }
      size_t i = 0;
      for (auto it = bytes.rbegin();
           (carry != 0 or i < length) and it != bytes.rend();
           ++it, ++i) {
        carry += 58 * (*it);
        *it = static_cast<uint8_t>(carry % 256);
        carry /= 256;
      }
      if (carry != 0) {
        return BaseError::INVALID_BASE58_INPUT;
      }
      length = i;
    }

    auto it = bytes.begin() + static_cast<long>(bytes.size() - length);
    while (it != bytes.end() and *it == 0) {
      ++it;
    }

    Bytes result(zeroes, 0);
    result.insert(result.end(), it, bytes.end());
    return result;
  }

}  // namespace peerscout::multi::detail
