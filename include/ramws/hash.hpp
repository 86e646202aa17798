#pragma once

// ramws/hash.hpp — BLAKE3 hashing for project keys, file comparison and the
// audit chain.

#include <string>
#include <string_view>

namespace ramws {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

// Core BLAKE3 hashing, 64-char lowercase hex.
std::string blake3_hex(std::string_view payload);

// Stream-hash a file and return a 64-char hex digest. Returns an empty string
// if the file cannot be opened or read.
// Uses a 64 KB read buffer; the digest equals blake3_hex(<file contents>).
std::string hash_file_blake3_hex(const std::string& path);

// Domain-separated hashing. Prefixes in use:
//   "proj:"  canonical project root, for project keys
//   "audit:" audit log chain entries
std::string hash_domain(std::string_view domain, std::string_view payload);

}  // namespace ramws
