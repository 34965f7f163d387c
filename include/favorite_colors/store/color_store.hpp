#pragma once

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <vector>

namespace favorite_colors {

// ---------------------------------------------------------------------------
// Outcomes of ColorStore operations. Every operation succeeds; the flags
// report whether the list changed and the message is user-facing text.
// ---------------------------------------------------------------------------
struct AddOutcome {
    std::string message;
    bool added = false;
};

struct RemoveOutcome {
    std::string message;
    bool removed = false;
};

struct ClearOutcome {
    std::string message;
    std::size_t previous_count = 0;
};

struct ColorSnapshot {
    std::vector<std::string> colors;
    std::string text;
};

// ---------------------------------------------------------------------------
// ColorStore: ordered list of distinct favorite colors.
//
// Matching is exact and case-sensitive. Reads take a shared lock, mutations
// an exclusive one; no lock is held beyond the in-memory list access.
// ---------------------------------------------------------------------------
class ColorStore {
public:
    ColorStore() = default;

    ColorStore(const ColorStore&) = delete;
    ColorStore& operator=(const ColorStore&) = delete;

    AddOutcome Add(const std::string& color);

    [[nodiscard]] ColorSnapshot Get() const;

    RemoveOutcome Remove(const std::string& color);

    ClearOutcome Clear();

    [[nodiscard]] std::size_t Count() const;

private:
    std::vector<std::string> colors_;
    mutable std::shared_mutex mutex_;
};

/// Render a color list the way get_colors reports it.
std::string FormatColorList(const std::vector<std::string>& colors);

} // namespace favorite_colors
