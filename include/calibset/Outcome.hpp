#ifndef CALIBSET_OUTCOME_HPP
#define CALIBSET_OUTCOME_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace calib {

enum class ItemStatus {
    Written,
    DecodeFailure,
    EncodeFailure,
    WriteFailure,
    Skipped    // never started because a stop was requested
};

inline const char* toString(ItemStatus status) {
    switch (status) {
        case ItemStatus::Written: return "written";
        case ItemStatus::DecodeFailure: return "decode failure";
        case ItemStatus::EncodeFailure: return "encode failure";
        case ItemStatus::WriteFailure: return "write failure";
        case ItemStatus::Skipped: return "skipped";
    }
    return "unknown";
}

// Result of one sample's decode -> resize -> encode -> write.
struct ItemOutcome {
    std::size_t ordinal = 0;
    std::filesystem::path source;
    std::filesystem::path output;
    ItemStatus status = ItemStatus::Skipped;
    std::string message;

    bool ok() const { return status == ItemStatus::Written; }
};

struct PipelineSummary {
    std::size_t collected = 0;
    std::size_t sampled = 0;
    bool used_all = false;
    std::size_t stale_removed = 0;
    std::size_t written = 0;
    std::size_t decode_failures = 0;
    std::size_t encode_failures = 0;
    std::size_t write_failures = 0;
    std::size_t skipped = 0;
    std::size_t manifest_entries = 0;
    std::filesystem::path manifest_path;
    bool interrupted = false;
    bool dry_run = false;
    std::vector<ItemOutcome> outcomes;   // indexed by ordinal

    std::size_t failures() const { return decode_failures + encode_failures + write_failures; }
};

} // namespace calib

#endif // CALIBSET_OUTCOME_HPP
