#pragma once

#include <string>
#include <string_view>

namespace jobclaim::util {

/*
  OpenSSL EVP digests, hex encoded.

  `algorithm` is any name EVP_get_digestbyname() accepts ("sha256",
  "sha512", "sha1", "md5", ...). Unknown names throw std::invalid_argument.
*/

std::string HexDigest(std::string_view algorithm, std::string_view data);

inline std::string Sha256Hex(std::string_view data) {
  return HexDigest("sha256", data);
}

// Streams the file through SHA-256. Used as the file_hash of an import claim.
std::string Sha256File(const std::string& path);

} // namespace jobclaim::util
