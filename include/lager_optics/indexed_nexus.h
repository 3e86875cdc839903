// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file indexed_nexus.h
/// @brief Dynamically derived per-element lenses into a list field.
///
/// Instead of a structural Traversal, the nexus between a record and its
/// sub-records can be a function that, given the current whole, returns one
/// Lens per sub-record. Each lens closes over a position and re-derives the
/// position -> element mapping from whatever whole it is later applied to.
///
/// The lenses are only valid for wholes whose list has the length of the
/// whole they were derived from. Updating through one of them keeps the
/// length, so applying the lenses of one derivation one after another to the
/// running whole is safe:
///
/// ```cpp
/// auto lenses = indexed_lenses(departments, budget, univ);
/// for (const auto& lens : lenses)
///     univ = lens.over(univ, [](int b) { return b * 2; });
/// ```
///
/// Applying them to an unrelated whole whose list has a different length is
/// detected and reported as a StaleAccessorError (see
/// LAGER_OPTICS_STRICT_NEXUS in lager_optics_config.h).

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/api.h>
#include <lager_optics/lens.h>

#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace lager_optics {

// ============================================================
// Positional index map
// ============================================================

template<typename T>
using IndexMap = immer::map<std::size_t, T>;

/// Map every position of `items` to its element
template<typename T>
[[nodiscard]] IndexMap<T> index_map(const immer::vector<T>& items) {
    auto out = IndexMap<T>{}.transient();
    for (std::size_t i = 0; i < items.size(); ++i) {
        out.set(i, items[i]);
    }
    return out.persistent();
}

/// Rebuild the list for positions 0..length-1, in positional order
template<typename T>
[[nodiscard]] immer::vector<T> rebuild_list(const IndexMap<T>& positions, std::size_t length) {
    auto out = immer::vector<T>{}.transient();
    for (std::size_t i = 0; i < length; ++i) {
        const T* item = positions.find(i);
        if (!item) {
            throw std::out_of_range("rebuild_list: no element at position " + std::to_string(i));
        }
        out.push_back(*item);
    }
    return out.persistent();
}

// ============================================================
// Staleness detection
// ============================================================

enum class NexusErrorCode {
    Success = 0,
    LengthMismatch,     // List length differs from the one the lens was derived from
    IndexOutOfRange,    // Position is past the end of the list
};

/// What a derived lens remembers about the whole it came from
struct NexusFingerprint {
    std::size_t index = 0;
    std::size_t length = 0;
};

struct NexusCheckResult {
    bool success = false;
    NexusErrorCode error_code = NexusErrorCode::Success;
    std::string error_message;
    NexusFingerprint fingerprint;
    std::size_t actual_length = 0;

    explicit operator bool() const noexcept { return success; }
};

class LAGER_OPTICS_API StaleAccessorError : public std::runtime_error {
public:
    explicit StaleAccessorError(const NexusCheckResult& result);

    [[nodiscard]] NexusErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const NexusFingerprint& fingerprint() const noexcept { return fingerprint_; }
    [[nodiscard]] std::size_t actual_length() const noexcept { return actual_length_; }

private:
    NexusErrorCode code_;
    NexusFingerprint fingerprint_;
    std::size_t actual_length_;
};

/// Check a fingerprint against the length of the list it is applied to
[[nodiscard]] LAGER_OPTICS_API NexusCheckResult check_nexus(const NexusFingerprint& fingerprint,
                                                            std::size_t actual_length);

/// Log a failed check to std::cerr, tagged with `where`
LAGER_OPTICS_API void report_stale_accessor(const char* where, const NexusCheckResult& result);

/// Handle a failed check on the set path. Throws StaleAccessorError when the
/// library was built with LAGER_OPTICS_STRICT_NEXUS=1, otherwise logs through
/// report_stale_accessor() and returns.
LAGER_OPTICS_API void reject_stale_set(const char* where, const NexusCheckResult& result);

// ============================================================
// indexed_lenses
// ============================================================

/// One lens per element of `list.get(whole)`, each focusing on `field` of
/// the element at its position
template<typename S, typename T, typename A>
[[nodiscard]] immer::vector<Lens<S, A>> indexed_lenses(const Lens<S, immer::vector<T>>& list,
                                                       const Lens<T, A>& field,
                                                       const S& whole) {
    const std::size_t length = list.get(whole).size();
    auto out = immer::vector<Lens<S, A>>{}.transient();
    for (std::size_t i = 0; i < length; ++i) {
        const NexusFingerprint fingerprint{i, length};
        out.push_back(make_lens<S, A>(
            // Getter
            [list, field, fingerprint](const S& current) -> A {
                auto items = list.get(current);
                if (auto check = check_nexus(fingerprint, items.size()); !check) {
                    throw StaleAccessorError{check};
                }
                return field.get(*index_map(items).find(fingerprint.index));
            },
            // Setter
            [list, field, fingerprint](S current, A part) -> S {
                auto items = list.get(current);
                if (auto check = check_nexus(fingerprint, items.size()); !check) {
                    reject_stale_set("indexed_lenses", check);
                    return current;
                }
                auto positions = index_map(items);
                auto element = field.set(*positions.find(fingerprint.index), std::move(part));
                auto rebuilt = rebuild_list(positions.set(fingerprint.index, std::move(element)),
                                            fingerprint.length);
                return list.set(std::move(current), std::move(rebuilt));
            }));
    }
    return out.persistent();
}

} // namespace lager_optics
