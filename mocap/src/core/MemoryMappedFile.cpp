#include "mocap/core/MemoryMappedFile.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace mocap::core {

MemoryMappedFile::MemoryMappedFile(const std::filesystem::path &path) {
#ifdef _WIN32
  HANDLE file = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr,
                            OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
  if (file == INVALID_HANDLE_VALUE) {
    return;
  }
  m_fileHandle = file;
  m_opened = true;

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(file, &fileSize) || fileSize.QuadPart == 0) {
    return;
  }
  m_size = static_cast<size_t>(fileSize.QuadPart);

  HANDLE mapping = CreateFileMappingW(file, nullptr, PAGE_READONLY, 0, 0, nullptr);
  if (mapping == nullptr) {
    m_size = 0;
    return;
  }
  m_mapHandle = mapping;

  m_data = static_cast<const uint8_t *>(
      MapViewOfFile(mapping, FILE_MAP_READ, 0, 0, 0));
  if (m_data == nullptr) {
    m_size = 0;
  }
#else
  int fd = open(path.string().c_str(), O_RDONLY);
  if (fd == -1)
    return;
  m_opened = true;

  struct stat sb;
  if (fstat(fd, &sb) == -1 || !S_ISREG(sb.st_mode) || sb.st_size == 0) {
    close(fd);
    return;
  }
  m_size = static_cast<size_t>(sb.st_size);

  void *mapped = mmap(nullptr, m_size, PROT_READ, MAP_PRIVATE, fd, 0);
  close(fd);

  if (mapped == MAP_FAILED) {
    m_size = 0;
    return;
  }
  m_data = static_cast<const uint8_t *>(mapped);
#endif
}

MemoryMappedFile::~MemoryMappedFile() {
#ifdef _WIN32
  if (m_data != nullptr) {
    UnmapViewOfFile(m_data);
  }
  if (m_mapHandle != nullptr) {
    CloseHandle(m_mapHandle);
  }
  if (m_fileHandle != INVALID_HANDLE_VALUE) {
    CloseHandle(m_fileHandle);
  }
#else
  if (m_data != nullptr) {
    munmap(const_cast<uint8_t *>(m_data), m_size);
  }
#endif
}

} // namespace mocap::core
