#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace scriptbox {

class FileUtils {
public:
    // Hash utilities (artifact digest recorded on each session)
    static std::string sha256_bytes(const std::vector<uint8_t>& data);
    static std::string sha256_string(const std::string& data);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Random 128-bit identifier in UUIDv4 text form, from OpenSSL's CSPRNG.
    // Throws std::runtime_error if the generator is not seeded.
    static std::string random_uuid();

    // Last path component of an uploaded name, or "" if it is unusable
    // ("..", ".", empty, or contains a NUL byte)
    static std::string sanitize_filename(const std::string& name);

    // Lowercased extension including the dot (".py"), or "" if none
    static std::string extension_of(const std::string& filename);

    // Write bytes to path, replacing any existing file
    static bool write_file(const std::string& path, const std::vector<uint8_t>& data);

    // Read at most max_bytes from path. Returns false if it cannot be opened.
    static bool read_file(const std::string& path, size_t max_bytes, std::string& out);
};

} // namespace scriptbox
