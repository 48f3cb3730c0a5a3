#include "ChunkedExporter.hpp"
#include <spdlog/spdlog.h>

#include "core/storage/CompressedFile.hpp"

namespace mba {

namespace fs = std::filesystem;

namespace {

// A chunk file in the staging area. Removed on every exit path.
class StagedChunk {
public:
  explicit StagedChunk(fs::path path) : path_(std::move(path)) {}
  ~StagedChunk() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) spdlog::warn("could not remove staged chunk {}: {}", path_.string(), ec.message());
  }

  StagedChunk(const StagedChunk&) = delete;
  StagedChunk& operator=(const StagedChunk&) = delete;

  const fs::path& path() const { return path_; }

private:
  fs::path path_;
};

} // namespace

ChunkedExporter::ChunkedExporter(MessageStore& store, ArchiveTransport& transport,
                                 QuotaTracker& quota, ExportOptions options)
  : store_(store), transport_(transport), quota_(quota), options_(std::move(options)) {
  if (options_.maxMessagesPerFile <= 0) options_.maxMessagesPerFile = kDefaultMaxMessagesPerFile;
}

template <typename Row, typename Encode>
int ChunkedExporter::writeChunk(Lookahead<Row>& rows, const fs::path& path, Encode&& encode) {
  DeflateFileWriter out(path);
  out.write("[");
  int written = 0;
  while (written < options_.maxMessagesPerFile && !rows.atEnd()) {
    const Row row = rows.take();
    std::optional<nlohmann::ordered_json> entry = encode(row);
    if (!entry) continue;
    if (written > 0) out.write(",");
    out.write(entry->dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace));
    ++written;
  }
  out.write("]");
  out.close();
  return written;
}

template <typename Row, typename Encode>
void ChunkedExporter::produceChunk(RecordKind kind, Lookahead<Row>& rows, Encode&& encode,
                                   BackupReport& report) {
  ChunkRecord chunk;
  chunk.name = chunkFileName(sequence_++, kind);
  chunk.kind = kind;

  StagedChunk staged(options_.stagingDir / chunk.name);
  chunk.entries = writeChunk(rows, staged.path(), encode);

  if (chunk.entries == 0) {
    spdlog::debug("{} has no entries, discarded", chunk.name);
    ++report.chunksEmpty;
    report.chunks.push_back(std::move(chunk));
    return;
  }

  chunk.bytes = static_cast<int64_t>(fs::file_size(staged.path()));
  (kind == RecordKind::Sms ? report.smsEntries : report.mmsEntries) += chunk.entries;

  if (quota_.shouldWithhold(chunk.bytes)) {
    spdlog::info("withholding {} ({} entries, {} bytes) to fit quota",
                 chunk.name, chunk.entries, chunk.bytes);
    chunk.fate = ChunkRecord::Fate::Withheld;
    ++report.chunksWithheld;
    report.bytesWithheld += chunk.bytes;
  } else {
    transport_.handOff(staged.path(), chunk.name);
    spdlog::info("backed up {} ({} entries, {} bytes)", chunk.name, chunk.entries, chunk.bytes);
    chunk.fate = ChunkRecord::Fate::HandedOff;
    ++report.chunksHandedOff;
    report.bytesHandedOff += chunk.bytes;
  }
  report.chunks.push_back(std::move(chunk));
}

BackupReport ChunkedExporter::run(IdentityResolver& identity) {
  fs::create_directories(options_.stagingDir);

  RecordEncoder encoder(identity, store_);
  auto encodeSms = [&](const SmsRow& row) -> std::optional<nlohmann::ordered_json> {
    return encoder.encodeSms(row);
  };
  auto encodeMms = [&](const MmsRow& row) { return encoder.encodeMms(row); };

  Lookahead<SmsRow> sms(store_.querySms());
  Lookahead<MmsRow> mms(store_.queryTextOnlyMms());

  BackupReport report;
  // sms dates are in ms, mms dates in seconds.
  while (!sms.atEnd() && !mms.atEnd()) {
    if (sms.peek().date / 1000 < mms.peek().date) {
      produceChunk(RecordKind::Sms, sms, encodeSms, report);
    } else {
      produceChunk(RecordKind::Mms, mms, encodeMms, report);
    }
  }
  while (!sms.atEnd()) produceChunk(RecordKind::Sms, sms, encodeSms, report);
  while (!mms.atEnd()) produceChunk(RecordKind::Mms, mms, encodeMms, report);

  spdlog::info("backup pass done: {} chunks archived, {} withheld, {} empty",
               report.chunksHandedOff, report.chunksWithheld, report.chunksEmpty);
  return report;
}

} // namespace mba
