#include "Frame.h"

#include <bitset>
#include <sstream>
#include <stdexcept>

using namespace std;

const std::size_t Frame::MAX_ALTERNATIVES;

int cardinality(FocalSet s) {
    return static_cast<int>(bitset<64>(s).count());
}

Frame::Frame(const vector<string>& alternatives) : alternatives_(alternatives), theta_(0) {
    // Input checks
    if (alternatives.empty()) {
        throw invalid_argument("The frame of discernment must contain at least one alternative.");
    }
    if (alternatives.size() > MAX_ALTERNATIVES) {
        throw invalid_argument("The frame of discernment is limited to " + to_string(MAX_ALTERNATIVES) +
                               " alternatives (got " + to_string(alternatives.size()) + ").");
    }
    for (size_t i = 0; i < alternatives.size(); ++i) {
        if (alternatives[i].empty()) {
            throw invalid_argument("Alternative identifiers must not be empty.");
        }
        if (!index_.insert(make_pair(alternatives[i], i)).second) {
            throw invalid_argument("Duplicate alternative '" + alternatives[i] + "' in the frame.");
        }
        theta_ |= FocalSet(1) << i;
    }
}

bool Frame::contains(const string& id) const {
    return index_.count(id) != 0;
}

size_t Frame::indexOf(const string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw invalid_argument("Unknown alternative '" + id + "'.");
    }
    return it->second;
}

FocalSet Frame::singleton(size_t i) const {
    if (i >= alternatives_.size()) {
        throw out_of_range("Alternative index " + to_string(i) + " is outside the frame.");
    }
    return FocalSet(1) << i;
}

FocalSet Frame::singleton(const string& id) const {
    return singleton(indexOf(id));
}

FocalSet Frame::subset(const vector<string>& ids) const {
    FocalSet s = EMPTY_SET;
    for (const auto& id : ids) {
        s |= singleton(id);
    }
    return s;
}

string Frame::label(FocalSet s) const {
    if (s == theta_) {
        return "Θ";
    }
    ostringstream out;
    out << "{";
    bool first = true;
    for (size_t i = 0; i < alternatives_.size(); ++i) {
        if (s & (FocalSet(1) << i)) {
            if (!first) out << ", ";
            out << alternatives_[i];
            first = false;
        }
    }
    out << "}";
    return out.str();
}
