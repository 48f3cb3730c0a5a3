#pragma once
#include <optional>
#include <string>

namespace mba {

enum class RecordKind { Sms, Mms };

// "000042_sms_backup". Zero padding keeps lexical order equal to sequence order.
std::string chunkFileName(int sequence, RecordKind kind);

// Kind encoded in a chunk file name suffix, nullopt for anything else.
std::optional<RecordKind> chunkKindOf(const std::string& fileName);

} // namespace mba
