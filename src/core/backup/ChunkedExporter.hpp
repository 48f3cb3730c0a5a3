#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/backup/QuotaTracker.hpp"
#include "core/codec/RecordCodec.hpp"
#include "core/identity/IdentityResolver.hpp"
#include "core/storage/ArchiveTransport.hpp"
#include "core/storage/ChunkName.hpp"
#include "core/store/MessageStore.hpp"

namespace mba {

constexpr int kDefaultMaxMessagesPerFile = 1000;

struct ExportOptions {
  std::filesystem::path stagingDir;
  int maxMessagesPerFile = kDefaultMaxMessagesPerFile;
};

// Outcome of one chunk, in production order.
struct ChunkRecord {
  enum class Fate { HandedOff, Withheld, Empty };

  std::string name;
  RecordKind  kind = RecordKind::Sms;
  int         entries = 0;
  int64_t     bytes = 0;
  Fate        fate = Fate::Empty;
};

struct BackupReport {
  std::vector<ChunkRecord> chunks;
  int     chunksHandedOff = 0;
  int     chunksWithheld = 0;
  int     chunksEmpty = 0;
  int64_t smsEntries = 0;
  int64_t mmsEntries = 0;
  int64_t bytesHandedOff = 0;
  int64_t bytesWithheld = 0;
};

// Single forward pass with one row of lookahead over a RowCursor.
template <typename Row>
class Lookahead {
public:
  explicit Lookahead(std::unique_ptr<RowCursor<Row>> cursor) : cursor_(std::move(cursor)) {
    fill();
  }

  bool atEnd() const { return !head_.has_value(); }
  const Row& peek() const { return *head_; }
  Row take() {
    Row row = std::move(*head_);
    fill();
    return row;
  }

private:
  void fill() { head_ = cursor_ ? cursor_->next() : std::nullopt; }

  std::unique_ptr<RowCursor<Row>> cursor_;
  std::optional<Row> head_;
};

// Merges the sms and text-only mms streams, oldest first, into chunks of at
// most maxMessagesPerFile entries and hands each kept chunk to the transport.
class ChunkedExporter {
public:
  ChunkedExporter(MessageStore& store, ArchiveTransport& transport, QuotaTracker& quota,
                  ExportOptions options);

  BackupReport run(IdentityResolver& identity);

private:
  template <typename Row, typename Encode>
  int writeChunk(Lookahead<Row>& rows, const std::filesystem::path& path, Encode&& encode);

  template <typename Row, typename Encode>
  void produceChunk(RecordKind kind, Lookahead<Row>& rows, Encode&& encode, BackupReport& report);

  MessageStore& store_;
  ArchiveTransport& transport_;
  QuotaTracker& quota_;
  ExportOptions options_;
  int sequence_ = 0;
};

} // namespace mba
