#ifndef VERIFYREP_COMMON_ROW_H_
#define VERIFYREP_COMMON_ROW_H_

#include <cstdint>
#include <string>
#include <vector>

namespace VerifyRep {

/**
 * One versioned value. Row key, family, qualifier, timestamp and value all
 * take part in equality.
 */
struct Cell {
    std::string row;
    std::string family;
    std::string qualifier;
    int64_t timestamp = 0;
    std::string value;

    bool operator==(const Cell& other) const;
    bool operator!=(const Cell& other) const { return !(*this == other); }

    /// family:qualifier/timestamp, bytes escaped
    std::string ToString() const;
};

/**
 * A row as produced by a scan: key plus its cells in scan order.
 */
struct Row {
    std::string key;
    std::vector<Cell> cells;

    bool operator==(const Row& other) const;
    bool operator!=(const Row& other) const { return !(*this == other); }

    std::string ToString() const;
};

/// Key range [start, end). An empty end means unbounded.
struct KeyRange {
    std::string start;
    std::string end;

    bool Contains(const std::string& key) const {
        return key >= start && (end.empty() || key < end);
    }

    bool operator==(const KeyRange& other) const {
        return start == other.start && end == other.end;
    }

    std::string ToString() const;
};

/// Printable form of a binary key or value
std::string EscapeBytes(const std::string& bytes);

} // namespace VerifyRep

#endif // VERIFYREP_COMMON_ROW_H_
