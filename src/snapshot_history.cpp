#include "tickflow/history/snapshot_history.hpp"

namespace tickflow {

std::unique_ptr<SnapshotHistory> make_snapshot_history(std::size_t capacity) {
    switch (capacity) {
        case 4:    return std::make_unique<FixedSnapshotHistory<4>>();
        case 8:    return std::make_unique<FixedSnapshotHistory<8>>();
        case 16:   return std::make_unique<FixedSnapshotHistory<16>>();
        case 32:   return std::make_unique<FixedSnapshotHistory<32>>();
        case 64:   return std::make_unique<FixedSnapshotHistory<64>>();
        case 128:  return std::make_unique<FixedSnapshotHistory<128>>();
        case 256:  return std::make_unique<FixedSnapshotHistory<256>>();
        case 512:  return std::make_unique<FixedSnapshotHistory<512>>();
        case 1024: return std::make_unique<FixedSnapshotHistory<1024>>();
        default:   return nullptr;
    }
}

} // namespace tickflow
