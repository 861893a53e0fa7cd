#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <openssl/evp.h>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string md5_hex(const std::string &data);

// Incremental MD5 over text fragments; hex_digest() may be called repeatedly.
class Md5Accumulator {
public:
  Md5Accumulator();
  ~Md5Accumulator();
  Md5Accumulator(const Md5Accumulator&) = delete;
  Md5Accumulator& operator=(const Md5Accumulator&) = delete;

  void update(const std::string& text);
  void update(const char* data, std::size_t length);
  std::string hex_digest() const;

private:
  EVP_MD_CTX* ctx_ = nullptr;
};

std::optional<std::string> compute_file_md5(const std::filesystem::path& file);
std::string iso_timestamp_now();
