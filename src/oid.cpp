#include "bsonkit/bson.hpp"

#include <chrono>
#include <string>

#include <openssl/evp.h>
#include <unistd.h>

namespace bsonkit {

static std::array<std::uint8_t, 3> machine_bytes(const std::string& host_name) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(host_name.data(), host_name.size(), digest, &digest_len, EVP_md5(), nullptr) != 1 ||
        digest_len < 3) {
        throw BsonError(ErrorKind::Io, "md5 digest of host name failed");
    }
    return {digest[0], digest[1], digest[2]};
}

static std::string local_host_name() {
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) {
        throw BsonError(ErrorKind::Io, "gethostname failed");
    }
    return std::string(buf);
}

ObjectIdGenerator::ObjectIdGenerator()
    : ObjectIdGenerator(local_host_name(), static_cast<std::uint32_t>(::getpid())) {}

ObjectIdGenerator::ObjectIdGenerator(const std::string& host_name, std::uint32_t pid)
    : machine_(machine_bytes(host_name)), pid_(static_cast<std::uint16_t>(pid & 0xFFFFu)) {}

ObjectId ObjectIdGenerator::next() {
    // The counter keeps 24 bits; fetch_add wraps the 32-bit atomic harmlessly.
    std::uint32_t count = (counter_.fetch_add(1, std::memory_order_relaxed) + 1) & 0xFFFFFFu;
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                    std::chrono::system_clock::now().time_since_epoch()).count();
    std::uint32_t t = static_cast<std::uint32_t>(secs);

    ObjectId id;
    id.bytes.resize(kObjectIdSize);
    auto& b = id.bytes;
    b[0] = static_cast<std::uint8_t>(t >> 24);
    b[1] = static_cast<std::uint8_t>(t >> 16);
    b[2] = static_cast<std::uint8_t>(t >> 8);
    b[3] = static_cast<std::uint8_t>(t);
    b[4] = machine_[0];
    b[5] = machine_[1];
    b[6] = machine_[2];
    b[7] = static_cast<std::uint8_t>(pid_ >> 8);
    b[8] = static_cast<std::uint8_t>(pid_);
    b[9] = static_cast<std::uint8_t>(count >> 16);
    b[10] = static_cast<std::uint8_t>(count >> 8);
    b[11] = static_cast<std::uint8_t>(count);
    return id;
}

} // namespace bsonkit
