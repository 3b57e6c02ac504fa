#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string_view>

namespace mocap::core {

// Read-only view of a whole file. The mapping lives as long as the object.
class MemoryMappedFile {
public:
  explicit MemoryMappedFile(const std::filesystem::path &path);
  ~MemoryMappedFile();

  MemoryMappedFile(const MemoryMappedFile &) = delete;
  MemoryMappedFile &operator=(const MemoryMappedFile &) = delete;

  [[nodiscard]] const uint8_t *data() const { return m_data; }
  [[nodiscard]] size_t size() const { return m_size; }
  [[nodiscard]] bool isValid() const { return m_data != nullptr; }

  // Whether open() succeeded; a zero-length file opens but does not map
  [[nodiscard]] bool opened() const { return m_opened; }

  [[nodiscard]] std::string_view text() const {
    return {reinterpret_cast<const char *>(m_data), m_size};
  }

private:
  const uint8_t *m_data = nullptr;
  size_t m_size = 0;
  bool m_opened = false;
#ifdef _WIN32
  void *m_fileHandle = reinterpret_cast<void *>(-1); // INVALID_HANDLE_VALUE
  void *m_mapHandle = nullptr;
#endif
};

} // namespace mocap::core
