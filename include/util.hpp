#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace rawlink {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);

std::string strprintf(const char* fmt, ...);

// Lowercase hex, two digits per byte, no separators.
std::string bytes_to_hex(const uint8_t* data, size_t len);
// Printable ASCII kept as-is, everything else rendered as '?'.
std::string printable_ascii(const uint8_t* data, size_t len);

bool read_file(const std::string& path, std::vector<uint8_t>& out, std::string& err);
bool write_file(const std::string& path, const std::vector<uint8_t>& data, std::string& err);

// Last path component of a sender-supplied name; "unnamed.raw" if nothing usable is left.
std::string sanitize_filename(const std::string& name);

} // namespace rawlink
