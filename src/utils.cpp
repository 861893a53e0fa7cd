#include "utils.hpp"

#include <array>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::string md5_hex(const std::string &data){
    Md5Accumulator acc;
    acc.update(data);
    return acc.hex_digest();
}

Md5Accumulator::Md5Accumulator() : ctx_(EVP_MD_CTX_new()) {
    if(!ctx_ || EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("Unable to initialise MD5 context");
    }
}

Md5Accumulator::~Md5Accumulator() {
    EVP_MD_CTX_free(ctx_);
}

void Md5Accumulator::update(const std::string& text) {
    update(text.data(), text.size());
}

void Md5Accumulator::update(const char* data, std::size_t length) {
    if(length == 0) return;
    if(EVP_DigestUpdate(ctx_, data, length) != 1) {
        throw std::runtime_error("MD5 update failed");
    }
}

std::string Md5Accumulator::hex_digest() const {
    // finalise a copy so the running state keeps accepting input
    EVP_MD_CTX* copy = EVP_MD_CTX_new();
    if(!copy || EVP_MD_CTX_copy_ex(copy, ctx_) != 1) {
        EVP_MD_CTX_free(copy);
        throw std::runtime_error("MD5 digest copy failed");
    }
    std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    int rc = EVP_DigestFinal_ex(copy, out.data(), &length);
    EVP_MD_CTX_free(copy);
    if(rc != 1) throw std::runtime_error("MD5 finalisation failed");
    out.resize(length);
    return hex_from_bytes(out);
}

std::optional<std::string> compute_file_md5(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if(!in) return std::nullopt;

    Md5Accumulator acc;
    std::array<char, 65536> buffer{};
    while(in) {
        in.read(buffer.data(), buffer.size());
        std::streamsize read = in.gcount();
        if(read > 0) {
            acc.update(buffer.data(), static_cast<std::size_t>(read));
        }
    }
    if(in.bad()) return std::nullopt;
    return acc.hex_digest();
}

std::string iso_timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;
    std::tm local{};
    localtime_r(&seconds, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}
