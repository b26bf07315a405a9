#include "LocalFSBackend.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace docguard {

std::string LocalFSBackend::put(const FileHash& hash, std::string_view bytes) {
  namespace fs = std::filesystem;
  const std::string hex = toHex(hash.data(), hash.size());
  fs::path dir = fs::path(root_) / hex.substr(0, 2);
  fs::create_directories(dir);
  fs::path file = dir / hex;
  {
    std::ofstream os(file, std::ios::binary | std::ios::trunc);
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) throw std::runtime_error("write failed: " + file.string());
  }
  return "file://" + fs::weakly_canonical(file).string();
}

} // namespace docguard
