#include "util.hpp"
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace rawlink {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos)
    return false;
  host = s.substr(0, pos);
  try {
    int p = std::stoi(s.substr(pos + 1));
    if (p < 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

std::string strprintf(const char *fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  va_list ap2;
  va_copy(ap2, ap);
  int n = std::vsnprintf(nullptr, 0, fmt, ap);
  va_end(ap);
  std::string out;
  if (n > 0) {
    out.resize((size_t)n + 1);
    std::vsnprintf(&out[0], out.size(), fmt, ap2);
    out.resize((size_t)n);
  }
  va_end(ap2);
  return out;
}

std::string bytes_to_hex(const uint8_t *data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; i++) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

std::string printable_ascii(const uint8_t *data, size_t len) {
  std::string out;
  out.reserve(len);
  for (size_t i = 0; i < len; i++)
    out.push_back((data[i] >= 32 && data[i] <= 126) ? (char)data[i] : '?');
  return out;
}

bool read_file(const std::string &path, std::vector<uint8_t> &out,
               std::string &err) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.good()) {
    err = "cannot open " + path + ": " + std::strerror(errno);
    return false;
  }
  ifs.seekg(0, std::ios::end);
  std::streamoff n = ifs.tellg();
  if (n < 0) {
    err = "cannot size " + path;
    return false;
  }
  ifs.seekg(0, std::ios::beg);
  out.resize((size_t)n);
  if (n > 0)
    ifs.read(reinterpret_cast<char *>(out.data()), (std::streamsize)n);
  if (ifs.gcount() != (std::streamsize)n) {
    err = "short read on " + path;
    out.clear();
    return false;
  }
  return true;
}

bool write_file(const std::string &path, const std::vector<uint8_t> &data,
                std::string &err) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs.good()) {
    err = "cannot create " + path + ": " + std::strerror(errno);
    return false;
  }
  if (!data.empty())
    ofs.write(reinterpret_cast<const char *>(data.data()),
              (std::streamsize)data.size());
  ofs.close();
  if (!ofs) {
    err = "write failed on " + path;
    return false;
  }
  return true;
}

std::string sanitize_filename(const std::string &name) {
  auto pos = name.find_last_of("/\\");
  std::string base = (pos == std::string::npos) ? name : name.substr(pos + 1);
  std::string out;
  for (char c : base) {
    if (c != '\0' && (unsigned char)c >= 32)
      out.push_back(c);
  }
  if (out.empty() || out == "." || out == "..")
    return "unnamed.raw";
  return out;
}

} // namespace rawlink
