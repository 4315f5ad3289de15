#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>


///////////////////////////
///       LOOKUP        ///
///////////////////////////
/**
 * @brief Read-only id lookup over the guest list of one run.
 *
 * Built once per optimization call and shared by the validator, scorers and
 * explanation generator so that every candidate plan is evaluated without
 * rebuilding maps. Holds a reference to the guest vector; the vector must
 * outlive the index.
 */
class GuestIndex {
public:
    explicit GuestIndex(const std::vector<Guest>& guests);

    /**
     * @brief Guest with the given id, or nullptr for unknown ids.
     */
    const Guest* find(const std::string& guestId) const;

    /**
     * @brief Position of the guest in the guest vector, or -1 if unknown.
     */
    int indexOf(const std::string& guestId) const;

    /**
     * @brief True if either guest lists the other as a known connection.
     */
    bool connected(const std::string& a, const std::string& b) const;

    const std::vector<Guest>& guests() const { return guests_; }

    int size() const { return (int)guests_.size(); }

private:
    const std::vector<Guest>& guests_;

    std::unordered_map<std::string, int> indexById_;

    /// Symmetric closure of knownConnections, keyed by guest id.
    std::unordered_map<std::string, std::unordered_set<std::string>> connections_;
};
