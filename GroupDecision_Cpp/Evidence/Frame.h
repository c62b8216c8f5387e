#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

// Subset of the frame of discernment: bit i set <=> alternative i belongs to it.
// Ordering of the integer values is the canonical order of focal elements.
typedef std::uint64_t FocalSet;

const FocalSet EMPTY_SET = 0;

inline FocalSet intersect(FocalSet a, FocalSet b) { return a & b; }
inline bool isSubset(FocalSet a, FocalSet b) { return (a & ~b) == 0; }
int cardinality(FocalSet s);

// Frame of discernment: fixed, non-empty, ordered set of alternatives
class Frame {
public:
    static const std::size_t MAX_ALTERNATIVES = 64;

    explicit Frame(const std::vector<std::string>& alternatives);

    std::size_t size() const { return alternatives_.size(); }
    const std::vector<std::string>& alternatives() const { return alternatives_; }
    const std::string& alternative(std::size_t i) const { return alternatives_.at(i); }

    bool contains(const std::string& id) const;
    std::size_t indexOf(const std::string& id) const;

    FocalSet theta() const { return theta_; }
    FocalSet singleton(std::size_t i) const;
    FocalSet singleton(const std::string& id) const;
    FocalSet subset(const std::vector<std::string>& ids) const;

    // "Θ" for the whole frame, "{a, b}" otherwise
    std::string label(FocalSet s) const;

    bool operator==(const Frame& other) const { return alternatives_ == other.alternatives_; }
    bool operator!=(const Frame& other) const { return !(*this == other); }

private:
    std::vector<std::string> alternatives_;
    std::map<std::string, std::size_t> index_;
    FocalSet theta_;
};
