///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "guest_index.hpp"


///////////////////////////
///       LOOKUP        ///
///////////////////////////
GuestIndex::GuestIndex(const std::vector<Guest>& guests) : guests_(guests) {
    indexById_.reserve(guests.size());
    for (int i = 0; i < (int)guests.size(); ++i) {
        // First occurrence wins if the caller passes duplicate ids.
        indexById_.emplace(guests[i].id, i);
    }

    for (const Guest& g : guests) {
        for (const std::string& other : g.knownConnections) {
            if (other == g.id) continue;
            connections_[g.id].insert(other);
            connections_[other].insert(g.id);
        }
    }
}

const Guest* GuestIndex::find(const std::string& guestId) const {
    auto it = indexById_.find(guestId);
    if (it == indexById_.end()) return nullptr;
    return &guests_[it->second];
}

int GuestIndex::indexOf(const std::string& guestId) const {
    auto it = indexById_.find(guestId);
    return it == indexById_.end() ? -1 : it->second;
}

bool GuestIndex::connected(const std::string& a, const std::string& b) const {
    auto it = connections_.find(a);
    if (it == connections_.end()) return false;
    return it->second.count(b) > 0;
}
