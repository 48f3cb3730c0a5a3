#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <zlib.h>

namespace mba {

// Open/read/write/inflate/deflate failure on an archive chunk file.
class ArchiveIoError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Streams text into a zlib-deflated file. close() must be called to finish
// the stream; the destructor only releases resources.
class DeflateFileWriter {
public:
  explicit DeflateFileWriter(const std::filesystem::path& path);
  ~DeflateFileWriter();

  DeflateFileWriter(const DeflateFileWriter&) = delete;
  DeflateFileWriter& operator=(const DeflateFileWriter&) = delete;

  void write(std::string_view text);
  void close();

private:
  void pump(int flush);

  std::filesystem::path path_;
  std::ofstream out_;
  z_stream zs_{};
  bool open_ = false;
  std::vector<unsigned char> buf_;
};

// Reads and inflates a whole chunk file.
std::string inflateFile(const std::filesystem::path& path);

} // namespace mba
