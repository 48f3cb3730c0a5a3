#include "CompressedFile.hpp"

namespace mba {

static constexpr size_t kBufferSize = 32 * 1024;

DeflateFileWriter::DeflateFileWriter(const std::filesystem::path& path)
  : path_(path), buf_(kBufferSize) {
  out_.open(path, std::ios::binary | std::ios::trunc);
  if (!out_) throw ArchiveIoError("cannot open for writing: " + path.string());
  if (deflateInit(&zs_, Z_DEFAULT_COMPRESSION) != Z_OK) {
    throw ArchiveIoError("deflateInit failed for " + path.string());
  }
  open_ = true;
}

DeflateFileWriter::~DeflateFileWriter() {
  if (open_) deflateEnd(&zs_);
}

void DeflateFileWriter::pump(int flush) {
  int rc;
  do {
    zs_.next_out = buf_.data();
    zs_.avail_out = static_cast<uInt>(buf_.size());
    rc = deflate(&zs_, flush);
    if (rc == Z_STREAM_ERROR) throw ArchiveIoError("deflate failed for " + path_.string());
    const size_t have = buf_.size() - zs_.avail_out;
    out_.write(reinterpret_cast<const char*>(buf_.data()), static_cast<std::streamsize>(have));
    if (!out_) throw ArchiveIoError("write failed: " + path_.string());
  } while (zs_.avail_out == 0 || (flush == Z_FINISH && rc != Z_STREAM_END));
}

void DeflateFileWriter::write(std::string_view text) {
  if (!open_) throw ArchiveIoError("write after close: " + path_.string());
  zs_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(text.data()));
  zs_.avail_in = static_cast<uInt>(text.size());
  pump(Z_NO_FLUSH);
}

void DeflateFileWriter::close() {
  if (!open_) return;
  zs_.next_in = nullptr;
  zs_.avail_in = 0;
  pump(Z_FINISH);
  deflateEnd(&zs_);
  open_ = false;
  out_.close();
  if (!out_) throw ArchiveIoError("close failed: " + path_.string());
}

std::string inflateFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw ArchiveIoError("cannot open for reading: " + path.string());

  z_stream zs{};
  if (inflateInit(&zs) != Z_OK) throw ArchiveIoError("inflateInit failed for " + path.string());

  std::vector<unsigned char> inBuf(kBufferSize), outBuf(kBufferSize);
  std::string text;
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    in.read(reinterpret_cast<char*>(inBuf.data()), static_cast<std::streamsize>(inBuf.size()));
    const auto got = in.gcount();
    if (got == 0) break;
    zs.next_in = inBuf.data();
    zs.avail_in = static_cast<uInt>(got);
    do {
      zs.next_out = outBuf.data();
      zs.avail_out = static_cast<uInt>(outBuf.size());
      rc = inflate(&zs, Z_NO_FLUSH);
      if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR || rc == Z_STREAM_ERROR) {
        inflateEnd(&zs);
        throw ArchiveIoError("corrupt deflate stream in " + path.string());
      }
      text.append(reinterpret_cast<const char*>(outBuf.data()), outBuf.size() - zs.avail_out);
    } while (zs.avail_out == 0 && rc != Z_STREAM_END);
  }
  inflateEnd(&zs);
  if (rc != Z_STREAM_END) throw ArchiveIoError("truncated deflate stream in " + path.string());
  return text;
}

} // namespace mba
